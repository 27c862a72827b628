#include <fstream>
#include <sstream>

#include "sheetsapi/exception.hpp"
#include "sheetsapi/util/json_file.hpp"

using json = nlohmann::json;

namespace sheetsapi {

json ReadJsonFile(const std::string &path, const std::string &description) {
	std::ifstream file(path);
	if (!file.is_open()) {
		throw SheetsIOException("Unable to open " + description + ": " + path);
	}
	std::stringstream buffer;
	buffer << file.rdbuf();

	try {
		return json::parse(buffer.str());
	} catch (const json::exception &e) {
		throw SheetsParseException("Failed to parse " + description + " " + path + ": " + e.what());
	}
}

void WriteJsonFile(const std::string &path, const json &value) {
	std::ofstream file(path, std::ios::out | std::ios::trunc);
	if (!file.is_open()) {
		throw SheetsIOException("Unable to write " + path);
	}
	file << value.dump(2);
	if (!file) {
		throw SheetsIOException("Failed writing " + path);
	}
}

} // namespace sheetsapi
