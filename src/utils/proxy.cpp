#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

#include "sheetsapi/exception.hpp"
#include "sheetsapi/transport/http_type.hpp"
#include "sheetsapi/utils/proxy.hpp"

namespace sheetsapi {

static bool StartsWith(const std::string &str, const std::string &prefix) {
	return str.compare(0, prefix.size(), prefix) == 0;
}

void ParseHttpProxyHost(const std::string &proxy_value, std::string &hostname_out, uint16_t &port_out) {
	uint16_t default_port = 80;
	auto sanitized_proxy_value = proxy_value;
	if (StartsWith(proxy_value, "http://")) {
		sanitized_proxy_value = proxy_value.substr(7);
	} else if (StartsWith(proxy_value, "https://")) {
		default_port = 443;
		sanitized_proxy_value = proxy_value.substr(8);
	}

	// Remove all trailing slashes to avoid issues with host path
	while (!sanitized_proxy_value.empty() && sanitized_proxy_value.back() == '/') {
		sanitized_proxy_value.pop_back();
	}
	if (sanitized_proxy_value.empty()) {
		throw SheetsConfigException("Failed to parse http_proxy '" + proxy_value + "': missing host");
	}

	auto colon = sanitized_proxy_value.find(':');
	if (colon == std::string::npos) {
		hostname_out = sanitized_proxy_value;
		port_out = default_port;
		return;
	}
	if (sanitized_proxy_value.find(':', colon + 1) != std::string::npos) {
		throw SheetsConfigException("Failed to parse http_proxy '" + proxy_value + "' into a host and port");
	}

	auto port_str = sanitized_proxy_value.substr(colon + 1);
	uint16_t port;
	try {
		size_t consumed = 0;
		auto val = std::stoul(port_str, &consumed);
		if (consumed != port_str.size() || val > std::numeric_limits<uint16_t>::max()) {
			throw SheetsConfigException("Failed to parse port from http_proxy '" + proxy_value + "'");
		}
		port = static_cast<uint16_t>(val);
	} catch (const std::invalid_argument &e) {
		throw SheetsConfigException("Failed to parse port from http_proxy '" + proxy_value + "'");
	} catch (const std::out_of_range &e) {
		throw SheetsConfigException("Failed to parse port from http_proxy '" + proxy_value + "'");
	}
	hostname_out = sanitized_proxy_value.substr(0, colon);
	port_out = port;
}

HttpProxyConfig GetHttpProxyConfig(const ClientConfig &config) {
	HttpProxyConfig proxy_config;
	if (config.httpProxy.empty()) {
		return proxy_config;
	}
	ParseHttpProxyHost(config.httpProxy, proxy_config.host, proxy_config.port);
	proxy_config.username = config.httpProxyUsername;
	proxy_config.password = config.httpProxyPassword;
	return proxy_config;
}

} // namespace sheetsapi
