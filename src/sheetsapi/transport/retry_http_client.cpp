#include "sheetsapi/transport/retry_http_client.hpp"
#include "sheetsapi/exception.hpp"
#include "sheetsapi/utils/logger.hpp"

#include <thread>

namespace sheetsapi {

bool IsRetryableStatusCode(int statusCode) {
	switch (statusCode) {
	case 429: // Too Many Requests (rate limit)
	case 500: // Internal Server Error
	case 502: // Bad Gateway
	case 503: // Service Unavailable
	case 504: // Gateway Timeout
		return true;
	default:
		return false;
	}
}

HttpResponse RetryingHttpClient::Execute(const HttpRequest &request) {
	auto backoff = initialBackoff;
	for (int attempt = 0;; attempt++) {
		bool lastAttempt = attempt >= maxRetries;
		try {
			HttpResponse response = inner->Execute(request);
			if (!IsRetryableStatusCode(response.statusCode) || lastAttempt) {
				return response;
			}
			SHEETSAPI_LOG_WARN("{} {} returned {}, retrying in {} ms ({}/{})", HttpMethodName(request.method),
			                   request.url, response.statusCode, backoff.count(), attempt + 1, maxRetries);
		} catch (const SheetsIOException &e) {
			if (lastAttempt) {
				throw;
			}
			SHEETSAPI_LOG_WARN("{} {} failed: {}, retrying in {} ms ({}/{})", HttpMethodName(request.method),
			                   request.url, e.what(), backoff.count(), attempt + 1, maxRetries);
		}
		std::this_thread::sleep_for(backoff);
		backoff *= 2;
	}
}

} // namespace sheetsapi
