#pragma once
#include <string>

#include "sheetsapi/auth/auth_provider.hpp"
#include "sheetsapi/transport/http_client.hpp"
#include "sheetsapi/transport/http_type.hpp"

namespace sheetsapi {

// Authorization is taken from the provider on every request, so a renewed token
// reaches resources that were handed out before the renewal.
class BaseResource {
protected:
	BaseResource(IHttpClient &http, IAuthProvider &auth, const HttpHeaders &headers, const std::string &baseUrl)
	    : http(http), auth(auth), headers(headers), baseUrl(baseUrl) {};

	IHttpClient &http;
	IAuthProvider &auth;
	HttpHeaders headers;
	std::string baseUrl;

	HttpResponse DoGet(const std::string &path);
	HttpResponse DoPost(const std::string &path, const std::string &body);
	HttpResponse DoPut(const std::string &path, const std::string &body);

private:
	HttpRequest NewRequest(HttpMethod method, const std::string &path);
};

} // namespace sheetsapi
