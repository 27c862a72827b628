#include "sheetsapi/auth_factory.hpp"

#include "sheetsapi/exception.hpp"
#include "sheetsapi/auth/bearer_token_auth.hpp"
#include "sheetsapi/auth/oauth_auth.hpp"
#include "sheetsapi/auth/service_account_auth.hpp"

namespace sheetsapi {

std::unique_ptr<IAuthProvider> CreateAuthProvider(const ClientConfig &config, IHttpClient &http) {
	if (config.credentialType == CREDENTIAL_TYPE_TOKEN) {
		if (config.token.empty()) {
			throw SheetsConfigException("'token' is required for credentialType 'token'");
		}
		return std::make_unique<BearerTokenAuth>(config.token);
	}
	if (config.credentialType == CREDENTIAL_TYPE_SERVICE_ACCOUNT) {
		if (config.serviceAccountKeyFile.empty()) {
			throw SheetsConfigException("'serviceAccountKeyFile' is required for credentialType 'service_account'");
		}
		auto key = ReadServiceAccountKey(config.serviceAccountKeyFile);
		return std::make_unique<ServiceAccountAuth>(http, key);
	}
	if (config.credentialType == CREDENTIAL_TYPE_OAUTH) {
		auto secret = ReadApplicationSecret(config.clientSecretFile);
		return std::make_unique<OAuthAuth>(http, secret, config.tokenCacheFile);
	}
	throw SheetsConfigException("Unknown credentialType '" + config.credentialType + "'");
}

} // namespace sheetsapi
