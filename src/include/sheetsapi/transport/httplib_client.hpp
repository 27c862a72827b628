#pragma once

#include <utility>

#include "sheetsapi/transport/http_client.hpp"
#include "sheetsapi/transport/http_type.hpp"

namespace sheetsapi {

class HttpLibClient : public IHttpClient {
public:
	explicit HttpLibClient(HttpProxyConfig proxy_config) : proxy_config(std::move(proxy_config)) {
	}

	HttpResponse Execute(const HttpRequest &request) override;

	// Splits "https://host/path?query" into "https://host" and "/path?query".
	static void ParseUrl(const std::string &url, std::string &baseUrl, std::string &path);

private:
	HttpProxyConfig proxy_config;
};

} // namespace sheetsapi
