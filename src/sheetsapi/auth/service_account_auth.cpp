#include <ctime>

#include "sheetsapi/auth/service_account_auth.hpp"
#include "sheetsapi/exception.hpp"
#include "sheetsapi/util/jwt.hpp"
#include "sheetsapi/util/json_file.hpp"
#include "sheetsapi/utils/logger.hpp"

using json = nlohmann::json;

namespace sheetsapi {

// Longest assertion lifetime Google accepts
constexpr int64_t ASSERTION_LIFETIME = 3600;

ServiceAccountKey ReadServiceAccountKey(const std::string &path) {
	json document = ReadJsonFile(path, "service account key file");
	ServiceAccountKey key;
	try {
		key = document.get<ServiceAccountKey>();
	} catch (const json::exception &e) {
		throw SheetsConfigException("Invalid service account key file " + path + ": " + e.what());
	}
	if (key.client_email.empty() || key.private_key.empty()) {
		throw SheetsConfigException("Service account key file " + path +
		                            " must contain 'client_email' and 'private_key'");
	}
	return key;
}

ServiceAccountAuth::ServiceAccountAuth(IHttpClient &http, const ServiceAccountKey &key)
    : RefreshingAuth(http, OAuthToken {}), key(key) {
}

void ServiceAccountAuth::Refresh() {
	auto issuedAt = static_cast<int64_t>(std::time(nullptr));
	json claims = {{"iss", key.client_email},
	               {"scope", SPREADSHEETS_SCOPE},
	               {"aud", key.token_uri},
	               {"iat", issuedAt},
	               {"exp", issuedAt + ASSERTION_LIFETIME}};

	std::string assertion = SignJwtRs256(claims, key.private_key);
	ExchangeToken(key.token_uri, "grant_type=urn:ietf:params:oauth:grant-type:jwt-bearer&assertion=" + assertion,
	              ASSERTION_LIFETIME);
	SHEETSAPI_LOG_INFO("Obtained access token for service account {}", key.client_email);
}

} // namespace sheetsapi
