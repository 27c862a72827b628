#include <catch2/catch.hpp>

#include "sheetsapi/exception.hpp"
#include "sheetsapi/utils/proxy.hpp"

TEST_CASE("ParseHttpProxyHost defaults the port by scheme", "[proxy]") {
	std::string host;
	uint16_t port = 0;

	sheetsapi::ParseHttpProxyHost("proxy.local", host, port);
	REQUIRE(host == "proxy.local");
	REQUIRE(port == 80);

	sheetsapi::ParseHttpProxyHost("http://proxy.local/", host, port);
	REQUIRE(host == "proxy.local");
	REQUIRE(port == 80);

	sheetsapi::ParseHttpProxyHost("https://proxy.local", host, port);
	REQUIRE(host == "proxy.local");
	REQUIRE(port == 443);
}

TEST_CASE("ParseHttpProxyHost reads an explicit port", "[proxy]") {
	std::string host;
	uint16_t port = 0;

	sheetsapi::ParseHttpProxyHost("http://10.0.0.1:3128//", host, port);
	REQUIRE(host == "10.0.0.1");
	REQUIRE(port == 3128);

	sheetsapi::ParseHttpProxyHost("https://proxy.local:8443", host, port);
	REQUIRE(port == 8443);
}

TEST_CASE("ParseHttpProxyHost rejects malformed values", "[proxy]") {
	std::string host;
	uint16_t port = 0;

	REQUIRE_THROWS_AS(sheetsapi::ParseHttpProxyHost("", host, port), sheetsapi::SheetsConfigException);
	REQUIRE_THROWS_AS(sheetsapi::ParseHttpProxyHost("http://", host, port), sheetsapi::SheetsConfigException);
	REQUIRE_THROWS_AS(sheetsapi::ParseHttpProxyHost("proxy:abc", host, port), sheetsapi::SheetsConfigException);
	REQUIRE_THROWS_AS(sheetsapi::ParseHttpProxyHost("proxy:", host, port), sheetsapi::SheetsConfigException);
	REQUIRE_THROWS_AS(sheetsapi::ParseHttpProxyHost("proxy:99999", host, port), sheetsapi::SheetsConfigException);
	REQUIRE_THROWS_AS(sheetsapi::ParseHttpProxyHost("proxy:80:81", host, port), sheetsapi::SheetsConfigException);
}

TEST_CASE("GetHttpProxyConfig", "[proxy]") {
	sheetsapi::ClientConfig config;
	REQUIRE(sheetsapi::GetHttpProxyConfig(config).host.empty());

	config.httpProxy = "http://proxy.local:3128";
	config.httpProxyUsername = "user";
	config.httpProxyPassword = "pass";
	auto proxy = sheetsapi::GetHttpProxyConfig(config);
	REQUIRE(proxy.host == "proxy.local");
	REQUIRE(proxy.port == 3128);
	REQUIRE(proxy.username == "user");
	REQUIRE(proxy.password == "pass");
}
