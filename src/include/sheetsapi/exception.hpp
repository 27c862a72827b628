#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace sheetsapi {

class SheetsException : public std::runtime_error {
public:
	explicit SheetsException(const std::string &message) : std::runtime_error(message) {
	}
};

// Column index beyond the last three-letter column (ZZZ).
class ColumnOutOfRangeException : public SheetsException {
public:
	explicit ColumnOutOfRangeException(uint64_t column)
	    : SheetsException("Column index " + std::to_string(column) +
	                      " is not supported, the last supported column is ZZZ (18277)"),
	      column(column) {
	}

	uint64_t GetColumn() const {
		return column;
	}

private:
	uint64_t column;
};

// Row index with no 1-indexed row number.
class RowOutOfRangeException : public SheetsException {
public:
	explicit RowOutOfRangeException(uint64_t row)
	    : SheetsException("Row index " + std::to_string(row) + " cannot be written as a row number"), row(row) {
	}

	uint64_t GetRow() const {
		return row;
	}

private:
	uint64_t row;
};

// Coordinate combination that does not form any A1 range.
class InvalidRangeShapeException : public SheetsException {
public:
	explicit InvalidRangeShapeException(const std::string &shape)
	    : SheetsException("Invalid range shape: " + shape), shape(shape) {
	}

	const std::string &GetShape() const {
		return shape;
	}

private:
	std::string shape;
};

class SheetsApiException : public SheetsException {
public:
	SheetsApiException(int statusCode, const std::string &apiMessage)
	    : SheetsException("Google Sheets API error (" + std::to_string(statusCode) + "): " + apiMessage),
	      statusCode(statusCode), apiMessage(apiMessage) {
	}

	int GetStatusCode() const {
		return statusCode;
	}

	const std::string &GetApiMessage() const {
		return apiMessage;
	}

private:
	int statusCode;
	std::string apiMessage;
};

class SheetsParseException : public SheetsException {
public:
	explicit SheetsParseException(const std::string &message) : SheetsException(message) {
	}
};

class SheetsIOException : public SheetsException {
public:
	explicit SheetsIOException(const std::string &message) : SheetsException(message) {
	}
};

class SheetsConfigException : public SheetsException {
public:
	explicit SheetsConfigException(const std::string &message) : SheetsException(message) {
	}
};

class SheetNotFoundException : public SheetsException {
public:
	explicit SheetNotFoundException(const std::string &identifier)
	    : SheetsException("Sheet not found: " + identifier), identifier(identifier) {
	}

	const std::string &GetIdentifier() const {
		return identifier;
	}

private:
	std::string identifier;
};

class SheetNotCreatedException : public SheetsException {
public:
	explicit SheetNotCreatedException(const std::string &name) : SheetsException("Sheet not created: " + name) {
	}
};

} // namespace sheetsapi
