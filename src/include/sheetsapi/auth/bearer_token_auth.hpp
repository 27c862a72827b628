#pragma once

#include <string>

#include "sheetsapi/auth/auth_provider.hpp"

namespace sheetsapi {

class BearerTokenAuth : public IAuthProvider {
public:
	explicit BearerTokenAuth(const std::string &token) : token(token) {
	}

	std::string GetAuthorizationHeader() override;

private:
	std::string token;
};

} // namespace sheetsapi
