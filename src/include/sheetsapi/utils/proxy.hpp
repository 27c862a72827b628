#pragma once

#include <cstdint>
#include <string>

#include "sheetsapi/transport/http_type.hpp"
#include "sheetsapi/utils/config.hpp"

namespace sheetsapi {

// Parses "[http://|https://]host[:port][/]". Without a port, 80 is used (443 for https).
void ParseHttpProxyHost(const std::string &proxy_value, std::string &hostname_out, uint16_t &port_out);

// Empty host when no proxy is configured.
HttpProxyConfig GetHttpProxyConfig(const ClientConfig &config);

} // namespace sheetsapi
