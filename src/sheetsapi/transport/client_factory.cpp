#include "sheetsapi/transport/client_factory.hpp"
#include "sheetsapi/transport/httplib_client.hpp"
#include "sheetsapi/transport/retry_http_client.hpp"
#include "sheetsapi/utils/proxy.hpp"

namespace sheetsapi {

std::unique_ptr<IHttpClient> CreateHttpClient(const ClientConfig &config) {
	auto proxy_config = GetHttpProxyConfig(config);
	auto client = std::make_unique<HttpLibClient>(proxy_config);
	return std::make_unique<RetryingHttpClient>(std::move(client), config.maxRetries,
	                                            std::chrono::milliseconds(config.initialBackoffMs));
}

} // namespace sheetsapi
