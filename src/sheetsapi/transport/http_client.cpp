#include "sheetsapi/transport/http_client.hpp"
#include "sheetsapi/transport/http_type.hpp"

namespace sheetsapi {

const char *HttpMethodName(HttpMethod method) {
	switch (method) {
	case HttpMethod::GET:
		return "GET";
	case HttpMethod::POST:
		return "POST";
	case HttpMethod::PUT:
		return "PUT";
	case HttpMethod::DEL:
		return "DELETE";
	}
	return "UNKNOWN";
}

HttpRequest IHttpClient::BuildRequest(const HttpMethod method, const std::string &url, const HttpHeaders &headers) {
	return HttpRequest {method, url, headers, ""};
}

HttpRequest IHttpClient::BuildRequest(const HttpMethod method, const std::string &url, const HttpHeaders &headers,
                                      const std::string &body) {
	return HttpRequest {method, url, headers, body};
}

HttpResponse IHttpClient::Get(const std::string &url, const HttpHeaders &headers) {
	return Execute(BuildRequest(HttpMethod::GET, url, headers));
}

HttpResponse IHttpClient::Post(const std::string &url, const HttpHeaders &headers, const std::string &body) {
	return Execute(BuildRequest(HttpMethod::POST, url, headers, body));
}

HttpResponse IHttpClient::Put(const std::string &url, const HttpHeaders &headers, const std::string &body) {
	return Execute(BuildRequest(HttpMethod::PUT, url, headers, body));
}

HttpResponse IHttpClient::Delete(const std::string &url, const HttpHeaders &headers) {
	return Execute(BuildRequest(HttpMethod::DEL, url, headers));
}

} // namespace sheetsapi
