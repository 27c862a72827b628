#include <ctime>

#include "sheetsapi/auth/refreshing_auth.hpp"
#include "sheetsapi/exception.hpp"
#include "sheetsapi/transport/http_type.hpp"

using json = nlohmann::json;

namespace sheetsapi {

static int64_t Now() {
	return static_cast<int64_t>(std::time(nullptr));
}

std::string RefreshingAuth::GetAuthorizationHeader() {
	if (NeedsRefresh()) {
		Refresh();
	}
	return "Bearer " + token.access_token;
}

bool RefreshingAuth::NeedsRefresh() const {
	if (token.access_token.empty()) {
		return true;
	}
	if (token.expires_at == 0) {
		return false;
	}
	return Now() >= token.expires_at - TOKEN_EXPIRY_MARGIN;
}

void RefreshingAuth::ExchangeToken(const std::string &tokenUri, const std::string &formBody,
                                   int64_t defaultLifetime) {
	HttpHeaders headers;
	headers["Content-Type"] = "application/x-www-form-urlencoded";
	HttpResponse response = http.Post(tokenUri, headers, formBody);

	if (response.statusCode != 200) {
		throw SheetsIOException("Token request to " + tokenUri + " failed (" + std::to_string(response.statusCode) +
		                        "): " + response.body);
	}

	json reply;
	try {
		reply = json::parse(response.body);
	} catch (const json::exception &) {
		throw SheetsIOException("Failed to parse token response: " + response.body);
	}

	auto accessToken = reply.find("access_token");
	if (accessToken == reply.end() || !accessToken->is_string()) {
		throw SheetsIOException("Token response missing 'access_token': " + response.body);
	}
	token.access_token = accessToken->get<std::string>();

	// Google only sends a new refresh token when it rotates the old one
	auto refreshToken = reply.find("refresh_token");
	if (refreshToken != reply.end() && refreshToken->is_string()) {
		token.refresh_token = refreshToken->get<std::string>();
	}
	auto tokenType = reply.find("token_type");
	if (tokenType != reply.end() && tokenType->is_string()) {
		token.token_type = tokenType->get<std::string>();
	}

	auto expiresIn = reply.find("expires_in");
	int64_t lifetime = defaultLifetime;
	if (expiresIn != reply.end() && expiresIn->is_number_integer()) {
		lifetime = expiresIn->get<int64_t>();
	}
	token.expires_at = lifetime > 0 ? Now() + lifetime : 0;
}

} // namespace sheetsapi
