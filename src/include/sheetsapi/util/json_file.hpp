#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace sheetsapi {

// Throws SheetsIOException when the file cannot be opened and SheetsParseException when
// it does not hold valid JSON. `description` names the file in error messages.
nlohmann::json ReadJsonFile(const std::string &path, const std::string &description);

// Replaces the file contents. Throws SheetsIOException on failure.
void WriteJsonFile(const std::string &path, const nlohmann::json &value);

} // namespace sheetsapi
