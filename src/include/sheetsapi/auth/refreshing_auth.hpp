#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "sheetsapi/auth/auth_provider.hpp"
#include "sheetsapi/transport/http_client.hpp"

namespace sheetsapi {

// An access token together with what is needed to renew it. expires_at is a Unix
// timestamp in seconds, 0 when unknown.
struct OAuthToken {
	std::string access_token = "";
	std::string refresh_token = "";
	std::string token_type = "Bearer";
	int64_t expires_at = 0;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(OAuthToken, access_token, refresh_token, token_type, expires_at)

/**
 * Holds a bearer token that expires and renews it on demand. A token is due for renewal
 * when it is empty or within TOKEN_EXPIRY_MARGIN seconds of expires_at; a token with
 * expires_at == 0 never expires. Subclasses implement Refresh() on top of ExchangeToken().
 */
class RefreshingAuth : public IAuthProvider {
public:
	std::string GetAuthorizationHeader() override;

	const OAuthToken &GetToken() const {
		return token;
	}

protected:
	RefreshingAuth(IHttpClient &http, const OAuthToken &token) : http(http), token(token) {
	}

	bool NeedsRefresh() const;

	// Posts a form encoded grant to tokenUri and takes the access token from the reply.
	// When the reply has no expires_in, the token lives for defaultLifetime seconds
	// (0 for no expiry). Throws SheetsIOException on any failure.
	void ExchangeToken(const std::string &tokenUri, const std::string &formBody, int64_t defaultLifetime);

	virtual void Refresh() = 0;

	IHttpClient &http;
	OAuthToken token;
};

} // namespace sheetsapi
