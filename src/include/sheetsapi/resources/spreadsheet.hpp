#pragma once

#include "sheetsapi/resources/base.hpp"
#include "sheetsapi/resources/values.hpp"
#include "sheetsapi/types.hpp"

namespace sheetsapi {

class SpreadsheetResource : protected BaseResource {
public:
	SpreadsheetResource(IHttpClient &http, IAuthProvider &auth, const HttpHeaders &headers, const std::string &baseUrl,
	                    const std::string &spreadsheetId)
	    : BaseResource(http, auth, headers, baseUrl), spreadsheetId(spreadsheetId) {};

	SpreadsheetMetadata Get();

	SheetMetadata GetSheetById(const int sheetId);
	SheetMetadata GetSheetById(const std::string &sheetId);
	SheetMetadata GetSheetByName(const std::string &name);
	SheetMetadata GetSheetByIndex(const int index);

	SheetMetadata CreateSheet(const std::string &name);

	ValuesResource Values();

	// Browser link to the spreadsheet
	std::string GetLink() const;

private:
	std::string spreadsheetId;

	SpreadsheetBatchUpdateResponse BatchUpdate(const SpreadsheetBatchUpdateRequest &req);
};

} // namespace sheetsapi
