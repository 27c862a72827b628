#include "sheetsapi/resources/base.hpp"
#include "sheetsapi/transport/http_type.hpp"

namespace sheetsapi {

HttpRequest BaseResource::NewRequest(HttpMethod method, const std::string &path) {
	HttpRequest req;
	req.url = baseUrl + path;
	req.method = method;
	req.headers = headers;
	req.headers["Authorization"] = auth.GetAuthorizationHeader();
	return req;
}

HttpResponse BaseResource::DoGet(const std::string &path) {
	return http.Execute(NewRequest(HttpMethod::GET, path));
}

HttpResponse BaseResource::DoPost(const std::string &path, const std::string &body) {
	HttpRequest req = NewRequest(HttpMethod::POST, path);
	req.body = body;
	return http.Execute(req);
}

HttpResponse BaseResource::DoPut(const std::string &path, const std::string &body) {
	HttpRequest req = NewRequest(HttpMethod::PUT, path);
	req.body = body;
	return http.Execute(req);
}

} // namespace sheetsapi
