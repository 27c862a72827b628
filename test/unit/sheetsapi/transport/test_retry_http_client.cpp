#include <catch2/catch.hpp>

#include <chrono>
#include <memory>

#include "sheetsapi/exception.hpp"
#include "sheetsapi/transport/mock_http_client.hpp"
#include "sheetsapi/transport/retry_http_client.hpp"

namespace {

// Fails with a transport error a fixed number of times, then answers 200
class FlakyHttpClient : public sheetsapi::IHttpClient {
public:
	explicit FlakyHttpClient(int failures) : failures(failures) {
	}

	sheetsapi::HttpResponse Execute(const sheetsapi::HttpRequest &) override {
		calls++;
		if (calls <= failures) {
			throw sheetsapi::SheetsIOException("connection reset");
		}
		return {200, {}, "ok"};
	}

	int failures;
	int calls = 0;
};

} // namespace

TEST_CASE("IsRetryableStatusCode", "[retry]") {
	REQUIRE(sheetsapi::IsRetryableStatusCode(429));
	REQUIRE(sheetsapi::IsRetryableStatusCode(500));
	REQUIRE(sheetsapi::IsRetryableStatusCode(502));
	REQUIRE(sheetsapi::IsRetryableStatusCode(503));
	REQUIRE(sheetsapi::IsRetryableStatusCode(504));
	REQUIRE_FALSE(sheetsapi::IsRetryableStatusCode(200));
	REQUIRE_FALSE(sheetsapi::IsRetryableStatusCode(400));
	REQUIRE_FALSE(sheetsapi::IsRetryableStatusCode(404));
	REQUIRE_FALSE(sheetsapi::IsRetryableStatusCode(501));
}

TEST_CASE("RetryingHttpClient retries a rate limited request", "[retry]") {
	auto mock = std::make_unique<sheetsapi::MockHttpClient>();
	auto *mockHttp = mock.get();
	mockHttp->AddResponse({429, {}, "slow down"});
	mockHttp->AddResponse({503, {}, "unavailable"});
	mockHttp->AddResponse({200, {}, "done"});

	sheetsapi::RetryingHttpClient client(std::move(mock), 5, std::chrono::milliseconds(0));

	auto response = client.Get("https://example.com", {});
	REQUIRE(response.statusCode == 200);
	REQUIRE(response.body == "done");
	REQUIRE(mockHttp->GetRecordedRequests().size() == 3);
}

TEST_CASE("RetryingHttpClient returns the last response once retries run out", "[retry]") {
	auto mock = std::make_unique<sheetsapi::MockHttpClient>();
	auto *mockHttp = mock.get();
	for (int i = 0; i < 3; i++) {
		mockHttp->AddResponse({429, {}, "attempt " + std::to_string(i)});
	}

	sheetsapi::RetryingHttpClient client(std::move(mock), 2, std::chrono::milliseconds(0));

	auto response = client.Get("https://example.com", {});
	REQUIRE(response.statusCode == 429);
	REQUIRE(response.body == "attempt 2");
	REQUIRE(mockHttp->GetRecordedRequests().size() == 3);
}

TEST_CASE("RetryingHttpClient does not retry client errors", "[retry]") {
	auto mock = std::make_unique<sheetsapi::MockHttpClient>();
	auto *mockHttp = mock.get();
	mockHttp->AddResponse({404, {}, "not found"});

	sheetsapi::RetryingHttpClient client(std::move(mock), 5, std::chrono::milliseconds(0));

	REQUIRE(client.Get("https://example.com", {}).statusCode == 404);
	REQUIRE(mockHttp->GetRecordedRequests().size() == 1);
}

TEST_CASE("RetryingHttpClient retries transport errors", "[retry]") {
	auto flaky = std::make_unique<FlakyHttpClient>(2);
	auto *flakyHttp = flaky.get();

	sheetsapi::RetryingHttpClient client(std::move(flaky), 3, std::chrono::milliseconds(0));

	REQUIRE(client.Get("https://example.com", {}).statusCode == 200);
	REQUIRE(flakyHttp->calls == 3);
}

TEST_CASE("RetryingHttpClient rethrows the last transport error", "[retry]") {
	auto flaky = std::make_unique<FlakyHttpClient>(10);
	auto *flakyHttp = flaky.get();

	sheetsapi::RetryingHttpClient client(std::move(flaky), 2, std::chrono::milliseconds(0));

	REQUIRE_THROWS_AS(client.Get("https://example.com", {}), sheetsapi::SheetsIOException);
	REQUIRE(flakyHttp->calls == 3);
}

TEST_CASE("RetryingHttpClient with no retries makes a single attempt", "[retry]") {
	auto mock = std::make_unique<sheetsapi::MockHttpClient>();
	auto *mockHttp = mock.get();
	mockHttp->AddResponse({500, {}, "boom"});

	sheetsapi::RetryingHttpClient client(std::move(mock), 0, std::chrono::milliseconds(0));

	REQUIRE(client.Get("https://example.com", {}).statusCode == 500);
	REQUIRE(mockHttp->GetRecordedRequests().size() == 1);
}
