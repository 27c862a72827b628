#pragma once

#include <vector>

#include "sheetsapi/transport/http_client.hpp"
#include "sheetsapi/transport/http_type.hpp"

namespace sheetsapi {

// Replays queued responses in order and records every request it receives.
class MockHttpClient : public IHttpClient {
public:
	HttpResponse Execute(const HttpRequest &request) override;
	void AddResponse(HttpResponse response);
	const std::vector<HttpRequest> &GetRecordedRequests() const;

private:
	size_t responseIndex = 0;
	std::vector<HttpResponse> responses;
	std::vector<HttpRequest> recordedRequests;
};

} // namespace sheetsapi
