#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "sheetsapi/transport/retry_http_client.hpp"

namespace sheetsapi {

constexpr const char *DEFAULT_SHEETS_API_URL = "https://sheets.googleapis.com/v4";

constexpr const char *CREDENTIAL_TYPE_TOKEN = "token";
constexpr const char *CREDENTIAL_TYPE_OAUTH = "oauth";
constexpr const char *CREDENTIAL_TYPE_SERVICE_ACCOUNT = "service_account";

struct ClientConfig {
	std::string endpoint = DEFAULT_SHEETS_API_URL;
	// One of "token", "oauth" or "service_account"
	std::string credentialType = CREDENTIAL_TYPE_OAUTH;
	std::string token = "";
	std::string clientSecretFile = "client_secret.json";
	std::string tokenCacheFile = "tokencache.json";
	std::string serviceAccountKeyFile = "";
	std::string httpProxy = "";
	std::string httpProxyUsername = "";
	std::string httpProxyPassword = "";
	int maxRetries = DEFAULT_MAX_RETRIES;
	int initialBackoffMs = DEFAULT_INITIAL_BACKOFF_MS;
	std::string logLevel = "warn";
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ClientConfig, endpoint, credentialType, token, clientSecretFile,
                                                tokenCacheFile, serviceAccountKeyFile, httpProxy, httpProxyUsername,
                                                httpProxyPassword, maxRetries, initialBackoffMs, logLevel)

/**
 * Reads a JSON config file. Every key is optional and falls back to the ClientConfig
 * default. Throws SheetsIOException if the file cannot be read and SheetsConfigException
 * if it is not valid JSON or a value has the wrong type.
 */
ClientConfig LoadConfigFile(const std::string &path);

// Overrides config values from SHEETSAPI_ENDPOINT, SHEETSAPI_TOKEN, SHEETSAPI_HTTP_PROXY
// and SHEETSAPI_LOG_LEVEL when they are set and non-empty.
void ApplyEnvironment(ClientConfig &config);

// Rejects values that cannot work: unknown credential type, negative retry settings,
// unknown log level.
void ValidateConfig(const ClientConfig &config);

// Applies logLevel to the process-wide logger.
void ConfigureLogging(const ClientConfig &config);

} // namespace sheetsapi
