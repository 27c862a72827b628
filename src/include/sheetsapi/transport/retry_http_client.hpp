#pragma once

#include <chrono>
#include <memory>

#include "sheetsapi/transport/http_client.hpp"
#include "sheetsapi/transport/http_type.hpp"

namespace sheetsapi {

constexpr int DEFAULT_MAX_RETRIES = 10;
constexpr int DEFAULT_INITIAL_BACKOFF_MS = 1000;

bool IsRetryableStatusCode(int statusCode);

// Exponential backoff retry strategy as per https://developers.google.com/sheets/api/limits
// Retries rate limiting, transient server errors and failed connections. Once the attempts
// run out, the last response is returned, or the last transport error rethrown.
class RetryingHttpClient : public IHttpClient {
public:
	RetryingHttpClient(std::unique_ptr<IHttpClient> inner, int maxRetries = DEFAULT_MAX_RETRIES,
	                   std::chrono::milliseconds initialBackoff = std::chrono::milliseconds(DEFAULT_INITIAL_BACKOFF_MS))
	    : inner(std::move(inner)), maxRetries(maxRetries), initialBackoff(initialBackoff) {
	}

	HttpResponse Execute(const HttpRequest &request) override;

private:
	std::unique_ptr<IHttpClient> inner;
	int maxRetries;
	std::chrono::milliseconds initialBackoff;
};

} // namespace sheetsapi
