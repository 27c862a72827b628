#include "sheetsapi/auth/oauth_auth.hpp"
#include "sheetsapi/exception.hpp"
#include "sheetsapi/util/encoding.hpp"
#include "sheetsapi/util/json_file.hpp"
#include "sheetsapi/utils/logger.hpp"

using json = nlohmann::json;

namespace sheetsapi {

ApplicationSecret ReadApplicationSecret(const std::string &path) {
	json document = ReadJsonFile(path, "client secret file");

	const char *kind = document.contains("installed") ? "installed" : "web";
	if (!document.contains(kind) || !document[kind].is_object()) {
		throw SheetsConfigException("Client secret file " + path + " has neither an 'installed' nor a 'web' entry");
	}

	ApplicationSecret secret;
	try {
		secret = document[kind].get<ApplicationSecret>();
	} catch (const json::exception &e) {
		throw SheetsConfigException("Invalid client secret file " + path + ": " + e.what());
	}
	if (secret.client_id.empty() || secret.client_secret.empty()) {
		throw SheetsConfigException("Client secret file " + path + " is missing client_id or client_secret");
	}
	return secret;
}

OAuthToken LoadTokenCache(const std::string &path) {
	json document = ReadJsonFile(path, "token cache");
	try {
		return document.get<OAuthToken>();
	} catch (const json::exception &e) {
		throw SheetsParseException("Invalid token cache " + path + ": " + e.what());
	}
}

void SaveTokenCache(const std::string &path, const OAuthToken &token) {
	WriteJsonFile(path, json(token));
	SHEETSAPI_LOG_DEBUG("Saved token cache to {}", path);
}

OAuthAuth::OAuthAuth(IHttpClient &http, const ApplicationSecret &secret, const std::string &tokenCachePath)
    : RefreshingAuth(http, OAuthToken {}), secret(secret), tokenCachePath(tokenCachePath) {
	try {
		token = LoadTokenCache(tokenCachePath);
	} catch (const SheetsException &e) {
		throw SheetsIOException(std::string(e.what()) +
		                        ". Authorize the application again and store its token in " + tokenCachePath);
	}
}

OAuthAuth::OAuthAuth(IHttpClient &http, const ApplicationSecret &secret, const OAuthToken &token,
                     const std::string &tokenCachePath)
    : RefreshingAuth(http, token), secret(secret), tokenCachePath(tokenCachePath) {
}

void OAuthAuth::Refresh() {
	if (token.refresh_token.empty()) {
		throw SheetsIOException("Access token is expired and no refresh token is available");
	}

	std::string body = "grant_type=refresh_token&client_id=" + UrlEncode(secret.client_id) +
	                   "&client_secret=" + UrlEncode(secret.client_secret) +
	                   "&refresh_token=" + UrlEncode(token.refresh_token);
	ExchangeToken(secret.token_uri, body, 0);
	SHEETSAPI_LOG_INFO("Refreshed OAuth access token for client {}", secret.client_id);

	if (!tokenCachePath.empty()) {
		SaveTokenCache(tokenCachePath, token);
	}
}

} // namespace sheetsapi
