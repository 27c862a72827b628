#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "sheetsapi/auth/refreshing_auth.hpp"
#include "sheetsapi/transport/http_client.hpp"

namespace sheetsapi {

// Client credentials of an OAuth application, as downloaded from the Google Cloud console.
struct ApplicationSecret {
	std::string client_id = "";
	std::string client_secret = "";
	std::string auth_uri = "https://accounts.google.com/o/oauth2/auth";
	std::string token_uri = TOKEN_ENDPOINT;
	std::vector<std::string> redirect_uris = {};
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ApplicationSecret, client_id, client_secret, auth_uri, token_uri,
                                                redirect_uris)

// Reads a client secret file holding either an "installed" or a "web" application.
ApplicationSecret ReadApplicationSecret(const std::string &path);

OAuthToken LoadTokenCache(const std::string &path);
void SaveTokenCache(const std::string &path, const OAuthToken &token);

/**
 * OAuth for an installed application. The token is renewed through the refresh-token
 * grant once it is about to expire, and written back to the token cache file so the
 * next run can reuse it.
 */
class OAuthAuth : public RefreshingAuth {
public:
	// Loads the token from the cache file.
	OAuthAuth(IHttpClient &http, const ApplicationSecret &secret, const std::string &tokenCachePath);
	// Starts from a token in hand. Refreshed tokens are only persisted when a cache path is given.
	OAuthAuth(IHttpClient &http, const ApplicationSecret &secret, const OAuthToken &token,
	          const std::string &tokenCachePath = "");

protected:
	void Refresh() override;

private:
	ApplicationSecret secret;
	std::string tokenCachePath;
};

} // namespace sheetsapi
