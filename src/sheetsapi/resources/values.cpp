#include <nlohmann/json.hpp>

#include "sheetsapi/types.hpp"
#include "sheetsapi/resources/values.hpp"
#include "sheetsapi/util/encoding.hpp"
#include "sheetsapi/util/response.hpp"
#include "sheetsapi/utils/logger.hpp"

using json = nlohmann::json;

namespace sheetsapi {

std::string ValuesResource::ValuesPath(const A1Range &range) const {
	return "/spreadsheets/" + spreadsheetId + "/values/" + UrlEncode(range.ToString());
}

ValueRange ValuesResource::Get(const A1Range &range) {
	return ParseResponse<ValueRange>(DoGet(ValuesPath(range)));
}

UpdateValuesResponse ValuesResource::Update(const A1Range &range, const ValueRange &values) {
	std::string path = ValuesPath(range) + "?valueInputOption=USER_ENTERED" +
	                   "&responseValueRenderOption=FORMATTED_VALUE&responseDateTimeRenderOption=FORMATTED_STRING";
	std::string body = json(values).dump();
	auto response = ParseResponse<UpdateValuesResponse>(DoPut(path, body));
	SHEETSAPI_LOG_DEBUG("Updated {}: {}", response.updatedRange, FormatUpdateSummary(response));
	return response;
}

AppendValuesResponse ValuesResource::Append(const A1Range &range, const ValueRange &values) {
	std::string path = ValuesPath(range) + ":append" + "?valueInputOption=USER_ENTERED&insertDataOption=INSERT_ROWS";
	std::string body = json(values).dump();
	return ParseResponse<AppendValuesResponse>(DoPost(path, body));
}

ClearValuesResponse ValuesResource::Clear(const A1Range &range) {
	return ParseResponse<ClearValuesResponse>(DoPost(ValuesPath(range) + ":clear", "{}"));
}

AppendValuesResponse ValuesResource::AppendRow(const std::vector<std::string> &row) {
	// An empty row still searches column A
	idx_t lastColumn = row.empty() ? 0 : row.size() - 1;
	RangeRequest request;
	request.startColumn = 0;
	request.endColumn = lastColumn;

	ValueRange values;
	values.values.push_back(row);
	return Append(A1Range::FromCoordinates(request), values);
}

ClearValuesResponse ValuesResource::ClearSheet(const std::string &sheetName) {
	return Clear(A1Range::WholeSheet(sheetName));
}

BatchUpdateValuesResponse ValuesResource::BatchUpdate(const std::vector<ValueRange> &data) {
	std::string path = "/spreadsheets/" + spreadsheetId + "/values:batchUpdate";
	BatchUpdateValuesRequest req;
	req.data = data;
	std::string body = json(req).dump();
	return ParseResponse<BatchUpdateValuesResponse>(DoPost(path, body));
}

UpdateValuesResponse ValuesResource::RefreshSheet(const std::string &sheetName,
                                                  const std::vector<std::vector<std::string>> &rows) {
	ClearSheet(sheetName);

	A1Range start = A1Range("A1").ForSheet(sheetName);
	ValueRange values;
	values.range = start.ToString();
	values.majorDimension = ROWS;
	values.values = rows;
	return Update(start, values);
}

} // namespace sheetsapi
