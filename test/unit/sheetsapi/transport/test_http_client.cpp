#include <catch2/catch.hpp>

#include "sheetsapi/exception.hpp"
#include "sheetsapi/transport/httplib_client.hpp"
#include "sheetsapi/transport/mock_http_client.hpp"

// =============================================================================
// IHttpClient helper methods
// =============================================================================

TEST_CASE("IHttpClient helpers build requests with the right method", "[http]") {
	sheetsapi::MockHttpClient mockHttp;
	for (int i = 0; i < 4; i++) {
		mockHttp.AddResponse({200, {}, ""});
	}

	sheetsapi::HttpHeaders headers {{"X-Test", "1"}};
	mockHttp.Get("https://example.com/a", headers);
	mockHttp.Post("https://example.com/b", headers, "post-body");
	mockHttp.Put("https://example.com/c", headers, "put-body");
	mockHttp.Delete("https://example.com/d", headers);

	auto requests = mockHttp.GetRecordedRequests();
	REQUIRE(requests.size() == 4);
	REQUIRE(requests[0].method == sheetsapi::HttpMethod::GET);
	REQUIRE(requests[0].body.empty());
	REQUIRE(requests[1].method == sheetsapi::HttpMethod::POST);
	REQUIRE(requests[1].body == "post-body");
	REQUIRE(requests[2].method == sheetsapi::HttpMethod::PUT);
	REQUIRE(requests[2].body == "put-body");
	REQUIRE(requests[3].method == sheetsapi::HttpMethod::DEL);
	REQUIRE(requests[3].url == "https://example.com/d");
	REQUIRE(requests[3].headers.at("X-Test") == "1");
}

TEST_CASE("HttpMethodName names every method", "[http]") {
	REQUIRE(std::string(sheetsapi::HttpMethodName(sheetsapi::HttpMethod::GET)) == "GET");
	REQUIRE(std::string(sheetsapi::HttpMethodName(sheetsapi::HttpMethod::POST)) == "POST");
	REQUIRE(std::string(sheetsapi::HttpMethodName(sheetsapi::HttpMethod::PUT)) == "PUT");
	REQUIRE(std::string(sheetsapi::HttpMethodName(sheetsapi::HttpMethod::DEL)) == "DELETE");
}

TEST_CASE("MockHttpClient throws once its responses run out", "[http]") {
	sheetsapi::MockHttpClient mockHttp;
	mockHttp.AddResponse({204, {}, ""});

	REQUIRE(mockHttp.Get("https://example.com", {}).statusCode == 204);
	REQUIRE_THROWS_AS(mockHttp.Get("https://example.com", {}), sheetsapi::SheetsIOException);
	REQUIRE(mockHttp.GetRecordedRequests().size() == 2);
}

// =============================================================================
// HttpLibClient::ParseUrl
// =============================================================================

TEST_CASE("HttpLibClient::ParseUrl splits host and path", "[http]") {
	std::string base;
	std::string path;

	sheetsapi::HttpLibClient::ParseUrl("https://sheets.googleapis.com/v4/spreadsheets/abc?x=1", base, path);
	REQUIRE(base == "https://sheets.googleapis.com");
	REQUIRE(path == "/v4/spreadsheets/abc?x=1");

	sheetsapi::HttpLibClient::ParseUrl("http://localhost:8080", base, path);
	REQUIRE(base == "http://localhost:8080");
	REQUIRE(path == "/");
}

TEST_CASE("HttpLibClient::ParseUrl rejects URLs without a scheme", "[http]") {
	std::string base;
	std::string path;
	REQUIRE_THROWS_AS(sheetsapi::HttpLibClient::ParseUrl("sheets.googleapis.com/v4", base, path),
	                  sheetsapi::SheetsIOException);
}
