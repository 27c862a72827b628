#include <regex>

#include "sheetsapi/exception.hpp"
#include "sheetsapi/util/spreadsheet_url.hpp"

namespace sheetsapi {

static const char SPREADSHEET_URL_MARKER[] = "docs.google.com/spreadsheets/d/";

std::string ExtractSpreadsheetId(const std::string &input) {
	// Check if the input is already a sheet ID (no slashes)
	if (input.find('/') == std::string::npos) {
		if (input.empty()) {
			throw SheetsConfigException("Empty Google Sheets URL or ID");
		}
		return input;
	}

	if (input.find(SPREADSHEET_URL_MARKER) != std::string::npos) {
		std::regex spreadsheet_id_regex("/d/([a-zA-Z0-9-_]+)");
		std::smatch match;

		if (std::regex_search(input, match, spreadsheet_id_regex) && match.size() > 1) {
			return match.str(1);
		}
	}

	throw SheetsConfigException("Invalid Google Sheets URL or ID: " + input);
}

std::string ExtractSheetId(const std::string &input) {
	if (input.find(SPREADSHEET_URL_MARKER) != std::string::npos && input.find("gid=") != std::string::npos) {
		std::regex sheet_id_regex("gid=([0-9]+)");
		std::smatch match;
		if (std::regex_search(input, match, sheet_id_regex) && match.size() > 1) {
			return match.str(1);
		}
	}
	return "";
}

std::string GetSpreadsheetLink(const std::string &spreadsheetId) {
	return "https://docs.google.com/spreadsheets/d/" + spreadsheetId + "/";
}

} // namespace sheetsapi
