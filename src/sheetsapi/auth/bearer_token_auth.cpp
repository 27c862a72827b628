#include "sheetsapi/auth/bearer_token_auth.hpp"

namespace sheetsapi {

std::string BearerTokenAuth::GetAuthorizationHeader() {
	return "Bearer " + token;
}

} // namespace sheetsapi
