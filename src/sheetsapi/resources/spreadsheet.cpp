#include <algorithm>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "sheetsapi/resources/spreadsheet.hpp"
#include "sheetsapi/exception.hpp"
#include "sheetsapi/resources/values.hpp"
#include "sheetsapi/types.hpp"
#include "sheetsapi/util/response.hpp"
#include "sheetsapi/util/spreadsheet_url.hpp"
#include "sheetsapi/utils/logger.hpp"

using json = nlohmann::json;

namespace sheetsapi {

SpreadsheetMetadata SpreadsheetResource::Get() {
	std::string path = "/spreadsheets/" + spreadsheetId;
	return ParseResponse<SpreadsheetMetadata>(DoGet(path));
}

// First sheet of `meta` matching `pred`; `label` names the lookup when none does.
template <class Predicate>
static SheetMetadata FindSheet(const SpreadsheetMetadata &meta, Predicate pred, const std::string &label) {
	auto it = std::find_if(meta.sheets.begin(), meta.sheets.end(), pred);
	if (it == meta.sheets.end()) {
		throw SheetNotFoundException(label);
	}
	return *it;
}

SheetMetadata SpreadsheetResource::GetSheetById(const int sheetId) {
	return FindSheet(
	    Get(), [sheetId](const SheetMetadata &sheet) { return sheet.properties.sheetId == sheetId; },
	    std::to_string(sheetId));
}

SheetMetadata SpreadsheetResource::GetSheetById(const std::string &sheetId) {
	// Sheet ids arrive as the gid of a link, so only a whole decimal number is accepted
	int id;
	size_t consumed = 0;
	try {
		id = std::stoi(sheetId, &consumed);
	} catch (const std::logic_error &) {
		throw SheetNotFoundException(sheetId);
	}
	if (consumed != sheetId.size()) {
		throw SheetNotFoundException(sheetId);
	}
	return GetSheetById(id);
}

SheetMetadata SpreadsheetResource::GetSheetByName(const std::string &name) {
	return FindSheet(
	    Get(), [&name](const SheetMetadata &sheet) { return sheet.properties.title == name; }, name);
}

SheetMetadata SpreadsheetResource::GetSheetByIndex(const int index) {
	return FindSheet(
	    Get(), [index](const SheetMetadata &sheet) { return sheet.properties.index == index; },
	    std::to_string(index));
}

SheetMetadata SpreadsheetResource::CreateSheet(const std::string &name) {
	SpreadsheetUpdateRequest update;
	update.addSheet.properties.title = name;

	SpreadsheetBatchUpdateRequest req;
	req.requests.push_back(update);

	SpreadsheetBatchUpdateResponse res = BatchUpdate(req);
	if (res.replies.empty()) {
		throw SheetNotCreatedException(name);
	}
	auto reply = res.replies.front();
	SHEETSAPI_LOG_INFO("Created sheet '{}' ({}) in {}", name, reply.addSheet.properties.sheetId, spreadsheetId);
	return reply.addSheet;
}

SpreadsheetBatchUpdateResponse SpreadsheetResource::BatchUpdate(const SpreadsheetBatchUpdateRequest &req) {
	std::string path = "/spreadsheets/" + spreadsheetId + ":batchUpdate";
	std::string body = json(req).dump();
	return ParseResponse<SpreadsheetBatchUpdateResponse>(DoPost(path, body));
}

ValuesResource SpreadsheetResource::Values() {
	return ValuesResource(http, auth, headers, baseUrl, spreadsheetId);
}

std::string SpreadsheetResource::GetLink() const {
	return GetSpreadsheetLink(spreadsheetId);
}

} // namespace sheetsapi
