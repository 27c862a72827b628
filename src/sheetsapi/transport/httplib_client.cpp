#define CPPHTTPLIB_OPENSSL_SUPPORT
#include <httplib.h>

#include "sheetsapi/exception.hpp"
#include "sheetsapi/transport/httplib_client.hpp"
#include "sheetsapi/transport/http_type.hpp"
#include "sheetsapi/utils/logger.hpp"

namespace sheetsapi {

void HttpLibClient::ParseUrl(const std::string &url, std::string &baseUrl, std::string &path) {
	const std::string schemaSep = "://";
	size_t schemeEnd = url.find(schemaSep);
	if (schemeEnd == std::string::npos) {
		throw SheetsIOException("Invalid URL: " + url);
	}

	size_t pathStart = url.find('/', schemeEnd + schemaSep.size());
	if (pathStart == std::string::npos) {
		baseUrl = url;
		path = "/";
	} else {
		baseUrl = url.substr(0, pathStart);
		path = url.substr(pathStart);
	}
}

HttpResponse HttpLibClient::Execute(const HttpRequest &request) {
	std::string baseUrl;
	std::string path;
	ParseUrl(request.url, baseUrl, path);

	httplib::Client client(baseUrl);
	if (!proxy_config.host.empty()) {
		client.set_proxy(proxy_config.host, proxy_config.port);
		if (!proxy_config.username.empty()) {
			client.set_proxy_basic_auth(proxy_config.username, proxy_config.password);
		}
	}

	// Content-Type travels as its own argument (default to application/json)
	std::string contentType = "application/json";
	httplib::Headers headers;
	for (const auto &h : request.headers) {
		if (h.first == "Content-Type") {
			contentType = h.second;
		} else {
			headers.insert(h);
		}
	}

	SHEETSAPI_LOG_DEBUG("{} {}{}", HttpMethodName(request.method), baseUrl, path);

	httplib::Result result;

	switch (request.method) {
	case HttpMethod::GET:
		result = client.Get(path, headers);
		break;
	case HttpMethod::POST:
		result = client.Post(path, headers, request.body, contentType);
		break;
	case HttpMethod::PUT:
		result = client.Put(path, headers, request.body, contentType);
		break;
	case HttpMethod::DEL:
		result = client.Delete(path, headers);
		break;
	}

	if (!result) {
		throw SheetsIOException("HTTP request failed: " + httplib::to_string(result.error()));
	}

	HttpResponse response;
	response.statusCode = result->status;
	response.body = result->body;
	for (const auto &h : result->headers) {
		response.headers[h.first] = h.second;
	}
	SHEETSAPI_LOG_DEBUG("{} {}{} -> {}", HttpMethodName(request.method), baseUrl, path, response.statusCode);
	return response;
}

} // namespace sheetsapi
