#pragma once

#include <string>

namespace sheetsapi {

constexpr const char *SPREADSHEETS_SCOPE = "https://www.googleapis.com/auth/spreadsheets";
constexpr const char *TOKEN_ENDPOINT = "https://oauth2.googleapis.com/token";

// Access tokens are refreshed this many seconds before they actually expire.
constexpr int TOKEN_EXPIRY_MARGIN = 60;

class IAuthProvider {
public:
	virtual ~IAuthProvider() = default;
	virtual std::string GetAuthorizationHeader() = 0;
};

} // namespace sheetsapi
