#pragma once

#include "sheetsapi/utils/config.hpp"
#include "sheetsapi/utils/version.hpp"

#include "sheetsapi/auth/auth_provider.hpp"
#include "sheetsapi/resources/spreadsheet.hpp"
#include "sheetsapi/transport/http_client.hpp"
#include "sheetsapi/transport/http_type.hpp"

namespace sheetsapi {

class GoogleSheetsClient {
public:
	GoogleSheetsClient(IHttpClient &http, IAuthProvider &auth, const std::string &baseUrl = DEFAULT_SHEETS_API_URL)
	    : http(http), auth(auth), headers(BuildHeaders()), baseUrl(baseUrl) {
	}

	SpreadsheetResource Spreadsheets(const std::string &spreadsheetId) {
		return SpreadsheetResource(http, auth, headers, baseUrl, spreadsheetId);
	}

private:
	IHttpClient &http;
	IAuthProvider &auth;
	HttpHeaders headers;
	std::string baseUrl;

	static HttpHeaders BuildHeaders() {
		HttpHeaders h;
		h["Content-Type"] = "application/json";
		h["Accept"] = "application/json";

		std::string version = getVersion();
		h["User-Agent"] = "sheetsapi/" + (version.empty() ? "dev" : version);

		return h;
	}
};

} // namespace sheetsapi
