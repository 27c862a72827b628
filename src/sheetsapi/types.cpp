#include "sheetsapi/types.hpp"

namespace sheetsapi {

std::string FormatUpdateSummary(const UpdateValuesResponse &response) {
	return std::to_string(response.updatedColumns) + " columns; " + std::to_string(response.updatedRows) +
	       " rows; and " + std::to_string(response.updatedCells) + " total cells updated";
}

} // namespace sheetsapi
