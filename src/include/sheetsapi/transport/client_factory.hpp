#pragma once

#include <memory>

#include "sheetsapi/transport/http_client.hpp"
#include "sheetsapi/utils/config.hpp"

namespace sheetsapi {

// An HttpLibClient honouring the configured proxy, wrapped in the configured retry policy.
std::unique_ptr<IHttpClient> CreateHttpClient(const ClientConfig &config);

} // namespace sheetsapi
