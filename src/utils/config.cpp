#include "sheetsapi/utils/config.hpp"
#include "sheetsapi/exception.hpp"
#include "sheetsapi/util/json_file.hpp"
#include "sheetsapi/utils/logger.hpp"

#include <cstdlib>

using json = nlohmann::json;

namespace sheetsapi {

ClientConfig LoadConfigFile(const std::string &path) {
	json document;
	try {
		document = ReadJsonFile(path, "config file");
	} catch (const SheetsParseException &e) {
		throw SheetsConfigException(e.what());
	}

	try {
		auto config = document.get<ClientConfig>();
		SHEETSAPI_LOG_DEBUG("Loaded config from {}", path);
		return config;
	} catch (const json::exception &e) {
		throw SheetsConfigException("Invalid config file " + path + ": " + e.what());
	}
}

static void OverrideFromEnv(const char *name, std::string &target) {
	const char *value = std::getenv(name);
	if (value && *value) {
		target = value;
	}
}

void ApplyEnvironment(ClientConfig &config) {
	OverrideFromEnv("SHEETSAPI_ENDPOINT", config.endpoint);
	OverrideFromEnv("SHEETSAPI_HTTP_PROXY", config.httpProxy);
	OverrideFromEnv("SHEETSAPI_LOG_LEVEL", config.logLevel);

	// A token in the environment always wins over file based credentials
	const char *token = std::getenv("SHEETSAPI_TOKEN");
	if (token && *token) {
		config.token = token;
		config.credentialType = CREDENTIAL_TYPE_TOKEN;
	}
}

void ValidateConfig(const ClientConfig &config) {
	if (config.endpoint.empty()) {
		throw SheetsConfigException("endpoint must not be empty");
	}
	if (config.credentialType != CREDENTIAL_TYPE_TOKEN && config.credentialType != CREDENTIAL_TYPE_OAUTH &&
	    config.credentialType != CREDENTIAL_TYPE_SERVICE_ACCOUNT) {
		throw SheetsConfigException("Unknown credentialType '" + config.credentialType + "'");
	}
	if (config.maxRetries < 0) {
		throw SheetsConfigException("maxRetries must not be negative");
	}
	if (config.initialBackoffMs < 0) {
		throw SheetsConfigException("initialBackoffMs must not be negative");
	}
	ParseLogLevel(config.logLevel);
}

void ConfigureLogging(const ClientConfig &config) {
	Logger::GetInstance().SetLevel(ParseLogLevel(config.logLevel));
}

} // namespace sheetsapi
