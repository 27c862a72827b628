#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace sheetsapi {

// Serializes `claims` as a compact JWS signed with RS256 ("header.claims.signature",
// each part Base64URL). Throws SheetsIOException when the PEM key cannot be loaded or
// used for signing.
std::string SignJwtRs256(const nlohmann::json &claims, const std::string &pemKey);

} // namespace sheetsapi
