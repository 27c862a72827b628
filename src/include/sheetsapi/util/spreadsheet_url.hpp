#pragma once

#include <string>

namespace sheetsapi {

// Accepts either a bare spreadsheet id or a docs.google.com/spreadsheets/d/<id>/... URL.
// Throws SheetsConfigException for any other URL.
std::string ExtractSpreadsheetId(const std::string &input);

// The "gid" of a spreadsheet URL, or an empty string when there is none.
std::string ExtractSheetId(const std::string &input);

// https://docs.google.com/spreadsheets/d/<id>/
std::string GetSpreadsheetLink(const std::string &spreadsheetId);

} // namespace sheetsapi
