#pragma once

#include <string>

namespace sheetsapi {

// Base64URL without padding, as used in JWTs.
std::string Base64UrlEncode(const unsigned char *data, size_t len);

std::string Base64UrlEncode(const std::string &input);

// Replaces literal "\n" escape sequences (as found in copied key files) with real newlines.
std::string NormalizePemKey(const std::string &key);

// Percent-encodes everything except unreserved characters (RFC 3986).
std::string UrlEncode(const std::string &str);

} // namespace sheetsapi
