#pragma once

#include <nlohmann/json.hpp>

#include "sheetsapi/exception.hpp"
#include "sheetsapi/transport/http_type.hpp"

namespace sheetsapi {

template <typename T>
T ParseResponse(const HttpResponse &response) {
	if (response.statusCode != 200) {
		throw SheetsApiException(response.statusCode, response.body);
	}
	try {
		return nlohmann::json::parse(response.body).get<T>();
	} catch (const nlohmann::json::exception &e) {
		throw SheetsParseException("Failed to parse response: " + std::string(e.what()));
	}
}

} // namespace sheetsapi
