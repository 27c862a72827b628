#pragma once

#include <string>

namespace sheetsapi {

/**
 * Retrieves version from macro if present or empty string if not
 */
std::string getVersion();

} // namespace sheetsapi
