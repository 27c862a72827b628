#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace sheetsapi {

using idx_t = uint64_t;

// Zero-indexed column of "ZZZ", the last column with a three-letter name.
constexpr idx_t MAX_COLUMN_INDEX = 18277;

// Zero-indexed coordinates of a range, any of which may be left open.
struct RangeRequest {
	std::optional<idx_t> startColumn;
	std::optional<idx_t> startRow;
	std::optional<idx_t> endColumn;
	std::optional<idx_t> endRow;
};

/**
 * Converts a zero-indexed column number into its letter name: 0 is "A", 25 is "Z",
 * 26 is "AA", 18277 is "ZZZ". Throws ColumnOutOfRangeException past MAX_COLUMN_INDEX.
 */
std::string ColumnToLetters(idx_t column);

/**
 * Builds the A1 notation for a range from zero-indexed coordinates. Rows are written
 * 1-indexed. Supported shapes:
 *   column + row .. column          "A5:A"   (also accepted with the row on the end bound)
 *   column + row .. column + row    "A1:B2"
 *   column .. column                "A:B"
 *   row .. column + row             "10:B18"
 *   row .. row                      "10:18"
 * Any other combination throws InvalidRangeShapeException.
 */
std::string BuildA1Notation(std::optional<idx_t> startColumn, std::optional<idx_t> startRow,
                            std::optional<idx_t> endColumn, std::optional<idx_t> endRow);

std::string BuildA1Notation(const RangeRequest &request);

class A1Range {
public:
	explicit A1Range(const std::string &range) : range(range) {
	}

	static A1Range FromCoordinates(const RangeRequest &request);

	// A range covering every cell of a sheet.
	static A1Range WholeSheet(const std::string &sheetName);

	// Prefixes the range with "Sheet!", quoting the sheet name where required.
	A1Range ForSheet(const std::string &sheetName) const;

	const std::string ToString() const {
		return range;
	}

	bool IsValid() const;

private:
	std::string range;
};

} // namespace sheetsapi
