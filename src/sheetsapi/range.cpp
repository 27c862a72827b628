#include "sheetsapi/range.hpp"
#include "sheetsapi/exception.hpp"

#include <cctype>
#include <limits>

namespace sheetsapi {

static const char LETTERS[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";

constexpr idx_t LETTER_COUNT = 26;
constexpr idx_t FIRST_TWO_LETTER_COLUMN = 26;    // AA
constexpr idx_t FIRST_THREE_LETTER_COLUMN = 702; // AAA

std::string ColumnToLetters(idx_t column) {
	// A - Z
	if (column < FIRST_TWO_LETTER_COLUMN) {
		return std::string(1, LETTERS[column]);
	}

	// AA - ZZ
	if (column < FIRST_THREE_LETTER_COLUMN) {
		return std::string {LETTERS[column / LETTER_COUNT - 1], LETTERS[column % LETTER_COUNT]};
	}

	// AAA - ZZZ
	if (column <= MAX_COLUMN_INDEX) {
		// Letters are digits 1..26 with no zero, so every place above the last one
		// borrows one unit from the value below it.
		idx_t leading = column / LETTER_COUNT - 1;
		return std::string {LETTERS[leading / LETTER_COUNT - 1], LETTERS[leading % LETTER_COUNT],
		                    LETTERS[column % LETTER_COUNT]};
	}

	throw ColumnOutOfRangeException(column);
}

static std::string RowNumber(idx_t row) {
	// Rows are written 1-indexed, so the largest index has no name
	if (row == std::numeric_limits<idx_t>::max()) {
		throw RowOutOfRangeException(row);
	}
	return std::to_string(row + 1);
}

static std::string DescribeCoordinate(const std::optional<idx_t> &value) {
	return value ? std::to_string(*value) : "none";
}

static std::string DescribeShape(const RangeRequest &request) {
	return "startColumn=" + DescribeCoordinate(request.startColumn) +
	       ", startRow=" + DescribeCoordinate(request.startRow) +
	       ", endColumn=" + DescribeCoordinate(request.endColumn) +
	       ", endRow=" + DescribeCoordinate(request.endRow);
}

std::string BuildA1Notation(const RangeRequest &request) {
	const auto &sc = request.startColumn;
	const auto &sr = request.startRow;
	const auto &ec = request.endColumn;
	const auto &er = request.endRow;

	if (sc && ec) {
		// "A5:A" is every cell of column A from row 5 down. "A:A5" is not valid
		// notation, so a row given only on the end bound is moved to the start.
		if (sr.has_value() != er.has_value()) {
			idx_t row = sr ? *sr : *er;
			return ColumnToLetters(*sc) + RowNumber(row) + ":" + ColumnToLetters(*ec);
		}
		// "A1:B2"
		if (sr && er) {
			return ColumnToLetters(*sc) + RowNumber(*sr) + ":" + ColumnToLetters(*ec) + RowNumber(*er);
		}
		// "A:B"
		return ColumnToLetters(*sc) + ":" + ColumnToLetters(*ec);
	}

	if (!sc && sr && er) {
		// "10:B18" is rows 10 through 18 from column B onward
		if (ec) {
			return RowNumber(*sr) + ":" + ColumnToLetters(*ec) + RowNumber(*er);
		}
		// "10:18"
		return RowNumber(*sr) + ":" + RowNumber(*er);
	}

	throw InvalidRangeShapeException(DescribeShape(request));
}

std::string BuildA1Notation(std::optional<idx_t> startColumn, std::optional<idx_t> startRow,
                            std::optional<idx_t> endColumn, std::optional<idx_t> endRow) {
	return BuildA1Notation(RangeRequest {startColumn, startRow, endColumn, endRow});
}

static bool NeedsQuoting(const std::string &sheetName) {
	if (sheetName.empty()) {
		return true;
	}
	for (char c : sheetName) {
		if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
			return true;
		}
	}
	return false;
}

static std::string QuoteSheetName(const std::string &sheetName) {
	if (!NeedsQuoting(sheetName)) {
		return sheetName;
	}
	std::string quoted = "'";
	for (char c : sheetName) {
		if (c == '\'') {
			quoted += "''";
		} else {
			quoted += c;
		}
	}
	quoted += "'";
	return quoted;
}

A1Range A1Range::FromCoordinates(const RangeRequest &request) {
	return A1Range(BuildA1Notation(request));
}

A1Range A1Range::WholeSheet(const std::string &sheetName) {
	return A1Range(QuoteSheetName(sheetName));
}

A1Range A1Range::ForSheet(const std::string &sheetName) const {
	return A1Range(QuoteSheetName(sheetName) + "!" + range);
}

namespace {

bool IsLetter(char c) {
	return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

bool IsDigit(char c) {
	return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool IsSheetNameChar(char c) {
	return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

// Cursor over "[sheet!]ref[:ref]" or a bare sheet name
class A1Reader {
public:
	explicit A1Reader(const std::string &text) : text(text) {
	}

	bool AtEnd() const {
		return pos == text.size();
	}

	void Rewind() {
		pos = 0;
	}

	bool Accept(char c) {
		if (AtEnd() || text[pos] != c) {
			return false;
		}
		pos++;
		return true;
	}

	size_t Skip(bool (*matches)(char)) {
		size_t start = pos;
		while (!AtEnd() && matches(text[pos])) {
			pos++;
		}
		return pos - start;
	}

	// 'name' where '' stands for one quote
	bool QuotedName() {
		if (!Accept('\'')) {
			return false;
		}
		while (!AtEnd()) {
			if (Accept('\'')) {
				if (!Accept('\'')) {
					return true;
				}
			} else {
				pos++;
			}
		}
		return false;
	}

	// [$]letters[[$]digits] or digits alone
	bool CellRef() {
		bool absoluteColumn = Accept('$');
		if (Skip(IsLetter) == 0) {
			return !absoluteColumn && Skip(IsDigit) > 0;
		}
		if (Accept('$')) {
			return Skip(IsDigit) > 0;
		}
		Skip(IsDigit);
		return true;
	}

	bool CellRange() {
		if (!CellRef()) {
			return false;
		}
		if (Accept(':') && !CellRef()) {
			return false;
		}
		return AtEnd();
	}

private:
	const std::string &text;
	size_t pos = 0;
};

} // namespace

bool A1Range::IsValid() const {
	if (range.empty()) {
		return false;
	}

	A1Reader reader(range);
	if (range.front() == '\'') {
		if (!reader.QuotedName()) {
			return false;
		}
		if (reader.AtEnd()) {
			return true;
		}
		if (!reader.Accept('!')) {
			return false;
		}
	} else if (reader.Skip(IsSheetNameChar) > 0) {
		// A bare name addresses the whole sheet ("A1" reads the same either way)
		if (reader.AtEnd()) {
			return true;
		}
		if (!reader.Accept('!')) {
			reader.Rewind();
		}
	}
	return reader.CellRange();
}

} // namespace sheetsapi
