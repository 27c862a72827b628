#pragma once

#include <memory>

#include "sheetsapi/auth/auth_provider.hpp"
#include "sheetsapi/transport/http_client.hpp"
#include "sheetsapi/utils/config.hpp"

namespace sheetsapi {

// Picks the provider named by config.credentialType. The returned provider keeps a
// reference to `http`, which must outlive it.
std::unique_ptr<IAuthProvider> CreateAuthProvider(const ClientConfig &config, IHttpClient &http);

} // namespace sheetsapi
