#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace sheetsapi {

enum SheetType { SHEET_TYPE_UNSPECIFIED, GRID, OBJECT, DATA_SOURCE };

NLOHMANN_JSON_SERIALIZE_ENUM(SheetType, {
                                            {SHEET_TYPE_UNSPECIFIED, "SHEET_TYPE_UNSPECIFIED"},
                                            {GRID, "GRID"},
                                            {OBJECT, "OBJECT"},
                                            {DATA_SOURCE, "DATA_SOURCE"},
                                        })

struct SheetMetadataProperties {
	int sheetId = 0;
	std::string title = "";
	int index = 0;
	SheetType sheetType = SHEET_TYPE_UNSPECIFIED;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(SheetMetadataProperties, sheetId, title, index, sheetType)

struct SheetMetadata {
	SheetMetadataProperties properties = {};
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(SheetMetadata, properties)

struct SpreadsheetMetadataProperties {
	std::string title = "";
	std::string locale = "";
	std::string timeZone = "";
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(SpreadsheetMetadataProperties, title, locale, timeZone)

struct SpreadsheetMetadata {
	std::string spreadsheetId = "";
	SpreadsheetMetadataProperties properties = {};
	std::vector<SheetMetadata> sheets = {};
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(SpreadsheetMetadata, spreadsheetId, properties, sheets)

struct AddSheetProperties {
	std::string title = "";
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(AddSheetProperties, title)

struct AddSheetRequest {
	AddSheetProperties properties = {};
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(AddSheetRequest, properties)

struct SpreadsheetUpdateRequest {
	AddSheetRequest addSheet = {};
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(SpreadsheetUpdateRequest, addSheet)

struct SpreadsheetBatchUpdateRequest {
	std::vector<SpreadsheetUpdateRequest> requests = {};
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(SpreadsheetBatchUpdateRequest, requests)

struct SpreadsheetUpdateReply {
	SheetMetadata addSheet = {};
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(SpreadsheetUpdateReply, addSheet)

struct SpreadsheetBatchUpdateResponse {
	std::string spreadsheetId = "";
	std::vector<SpreadsheetUpdateReply> replies = {};
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(SpreadsheetBatchUpdateResponse, spreadsheetId, replies)

enum MajorDimension { DIMENSION_UNSPECIFIED, ROWS, COLUMNS };

NLOHMANN_JSON_SERIALIZE_ENUM(MajorDimension, {
                                                 {DIMENSION_UNSPECIFIED, "DIMENSION_UNSPECIFIED"},
                                                 {ROWS, "ROWS"},
                                                 {COLUMNS, "COLUMNS"},
                                             })

/**
 * Values of a range. With majorDimension ROWS, values[i][j] is row i, column j of the
 * range; with COLUMNS the indices are swapped.
 */
struct ValueRange {
	std::string range = "";
	MajorDimension majorDimension = ROWS;
	std::vector<std::vector<std::string>> values = {};
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ValueRange, range, majorDimension, values)

struct UpdateValuesResponse {
	std::string spreadsheetId = "";
	std::string updatedRange = "";
	int updatedRows = 0;
	int updatedColumns = 0;
	int updatedCells = 0;
	ValueRange updatedData = {};
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(UpdateValuesResponse, spreadsheetId, updatedRange, updatedRows,
                                                updatedColumns, updatedCells, updatedData)

// "3 columns; 2 rows; and 6 total cells updated"
std::string FormatUpdateSummary(const UpdateValuesResponse &response);

struct AppendValuesResponse {
	std::string spreadsheetId = "";
	std::string tableRange = "";
	UpdateValuesResponse updates = {};
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(AppendValuesResponse, spreadsheetId, tableRange, updates)

struct ClearValuesResponse {
	std::string spreadsheetId;
	std::string clearedRange;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ClearValuesResponse, spreadsheetId, clearedRange)

struct BatchUpdateValuesRequest {
	std::string valueInputOption = "USER_ENTERED";
	std::vector<ValueRange> data = {};
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(BatchUpdateValuesRequest, valueInputOption, data)

struct BatchUpdateValuesResponse {
	std::string spreadsheetId = "";
	int totalUpdatedRows = 0;
	int totalUpdatedColumns = 0;
	int totalUpdatedCells = 0;
	int totalUpdatedSheets = 0;
	// One entry per requested range, in request order
	std::vector<UpdateValuesResponse> responses = {};
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(BatchUpdateValuesResponse, spreadsheetId, totalUpdatedRows,
                                                totalUpdatedColumns, totalUpdatedCells, totalUpdatedSheets,
                                                responses)

} // namespace sheetsapi
