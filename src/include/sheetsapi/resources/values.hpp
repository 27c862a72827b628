#pragma once

#include "sheetsapi/range.hpp"
#include "sheetsapi/resources/base.hpp"
#include "sheetsapi/transport/http_client.hpp"
#include "sheetsapi/transport/http_type.hpp"
#include "sheetsapi/types.hpp"

namespace sheetsapi {

class ValuesResource : protected BaseResource {
public:
	ValuesResource(IHttpClient &http, IAuthProvider &auth, const HttpHeaders &headers, const std::string &baseUrl,
	               const std::string &spreadsheetId)
	    : BaseResource(http, auth, headers, baseUrl), spreadsheetId(spreadsheetId) {};

	ValueRange Get(const A1Range &range);
	UpdateValuesResponse Update(const A1Range &range, const ValueRange &values);
	AppendValuesResponse Append(const A1Range &range, const ValueRange &values);
	ClearValuesResponse Clear(const A1Range &range);

	// Appends one row under the existing table of the first sheet, searching the
	// columns the row spans.
	AppendValuesResponse AppendRow(const std::vector<std::string> &row);

	ClearValuesResponse ClearSheet(const std::string &sheetName);

	BatchUpdateValuesResponse BatchUpdate(const std::vector<ValueRange> &data);

	// Clears the whole sheet, then writes `rows` starting at its first cell.
	UpdateValuesResponse RefreshSheet(const std::string &sheetName, const std::vector<std::vector<std::string>> &rows);

private:
	std::string spreadsheetId;

	std::string ValuesPath(const A1Range &range) const;
};

} // namespace sheetsapi
