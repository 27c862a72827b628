#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "sheetsapi/auth/refreshing_auth.hpp"
#include "sheetsapi/transport/http_client.hpp"

namespace sheetsapi {

// The fields of a service account key file this client needs.
struct ServiceAccountKey {
	std::string client_email = "";
	std::string private_key = "";
	std::string token_uri = TOKEN_ENDPOINT;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ServiceAccountKey, client_email, private_key, token_uri)

// Throws SheetsConfigException when client_email or private_key is missing.
ServiceAccountKey ReadServiceAccountKey(const std::string &path);

// Server-to-server auth: a self-signed RS256 assertion is traded for an access token
// through the JWT bearer grant whenever the previous one is about to expire.
class ServiceAccountAuth : public RefreshingAuth {
public:
	ServiceAccountAuth(IHttpClient &http, const ServiceAccountKey &key);

protected:
	void Refresh() override;

private:
	ServiceAccountKey key;
};

} // namespace sheetsapi
