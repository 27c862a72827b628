#include <catch2/catch.hpp>

#include <limits>

#include "sheetsapi/exception.hpp"
#include "sheetsapi/range.hpp"

using sheetsapi::BuildA1Notation;
using sheetsapi::RangeRequest;

// =============================================================================
// Supported range shapes
// =============================================================================

TEST_CASE("BuildA1Notation builds a bounded rectangle", "[notation]") {
	REQUIRE(BuildA1Notation(0, 0, 0, 0) == "A1:A1");
	REQUIRE(BuildA1Notation(0, 1, 1, 4) == "A2:B5");
	REQUIRE(BuildA1Notation(0, 0, 2, 2) == "A1:C3");
	REQUIRE(BuildA1Notation(26, 99, 701, 999) == "AA100:ZZ1000");
}

TEST_CASE("BuildA1Notation builds a column range open at the bottom", "[notation]") {
	REQUIRE(BuildA1Notation(0, 0, 0, std::nullopt) == "A1:A");
	REQUIRE(BuildA1Notation(1, 4, 3, std::nullopt) == "B5:D");
}

TEST_CASE("BuildA1Notation moves a lone end row to the start bound", "[notation]") {
	REQUIRE(BuildA1Notation(0, std::nullopt, 0, 0) == "A1:A");
	REQUIRE(BuildA1Notation(1, std::nullopt, 3, 4) == "B5:D");
	REQUIRE(BuildA1Notation(0, std::nullopt, 0, 0) == BuildA1Notation(0, 0, 0, std::nullopt));
}

TEST_CASE("BuildA1Notation builds whole columns", "[notation]") {
	REQUIRE(BuildA1Notation(0, std::nullopt, 3, std::nullopt) == "A:D");
	REQUIRE(BuildA1Notation(702, std::nullopt, 18277, std::nullopt) == "AAA:ZZZ");
}

TEST_CASE("BuildA1Notation builds rows with a column on the end bound", "[notation]") {
	REQUIRE(BuildA1Notation(std::nullopt, 9, 3, 17) == "10:D18");
	REQUIRE(BuildA1Notation(std::nullopt, 4, 2, 8) == "5:C9");
}

TEST_CASE("BuildA1Notation builds whole rows", "[notation]") {
	REQUIRE(BuildA1Notation(std::nullopt, 9, std::nullopt, 17) == "10:18");
	REQUIRE(BuildA1Notation(std::nullopt, 4, std::nullopt, 8) == "5:9");
	REQUIRE(BuildA1Notation(std::nullopt, 0, std::nullopt, 0) == "1:1");
}

TEST_CASE("BuildA1Notation does not bound rows", "[notation]") {
	REQUIRE(BuildA1Notation(std::nullopt, 1048575, std::nullopt, 9999999999ULL) == "1048576:10000000000");
}

TEST_CASE("BuildA1Notation accepts a RangeRequest", "[notation]") {
	RangeRequest request;
	request.startColumn = 0;
	request.startRow = 1;
	request.endColumn = 1;
	request.endRow = 4;
	REQUIRE(BuildA1Notation(request) == "A2:B5");
}

// =============================================================================
// Invalid shapes
// =============================================================================

TEST_CASE("BuildA1Notation rejects an empty request", "[notation]") {
	REQUIRE_THROWS_AS(BuildA1Notation(RangeRequest {}), sheetsapi::InvalidRangeShapeException);
	REQUIRE_THROWS_AS(BuildA1Notation(std::nullopt, std::nullopt, std::nullopt, std::nullopt),
	                  sheetsapi::InvalidRangeShapeException);
}

TEST_CASE("BuildA1Notation rejects a start column without an end column", "[notation]") {
	REQUIRE_THROWS_AS(BuildA1Notation(0, 0, std::nullopt, 0), sheetsapi::InvalidRangeShapeException);
	REQUIRE_THROWS_AS(BuildA1Notation(0, std::nullopt, std::nullopt, std::nullopt),
	                  sheetsapi::InvalidRangeShapeException);
}

TEST_CASE("BuildA1Notation rejects rows missing a bound", "[notation]") {
	REQUIRE_THROWS_AS(BuildA1Notation(std::nullopt, 9, std::nullopt, std::nullopt),
	                  sheetsapi::InvalidRangeShapeException);
	REQUIRE_THROWS_AS(BuildA1Notation(std::nullopt, std::nullopt, std::nullopt, 9),
	                  sheetsapi::InvalidRangeShapeException);
	REQUIRE_THROWS_AS(BuildA1Notation(std::nullopt, 9, 3, std::nullopt), sheetsapi::InvalidRangeShapeException);
	REQUIRE_THROWS_AS(BuildA1Notation(std::nullopt, std::nullopt, 3, 9), sheetsapi::InvalidRangeShapeException);
}

TEST_CASE("InvalidRangeShapeException names the coordinates given", "[notation]") {
	try {
		BuildA1Notation(std::nullopt, 9, std::nullopt, std::nullopt);
		FAIL("expected InvalidRangeShapeException");
	} catch (const sheetsapi::InvalidRangeShapeException &e) {
		REQUIRE(e.GetShape() == "startColumn=none, startRow=9, endColumn=none, endRow=none");
	}
}

TEST_CASE("BuildA1Notation propagates columns past ZZZ", "[notation]") {
	REQUIRE_THROWS_AS(BuildA1Notation(0, 0, 18278, 0), sheetsapi::ColumnOutOfRangeException);
	REQUIRE_THROWS_AS(BuildA1Notation(std::nullopt, 0, 18278, 5), sheetsapi::ColumnOutOfRangeException);
}

TEST_CASE("BuildA1Notation rejects a row index with no 1-indexed number", "[notation]") {
	constexpr auto lastIndex = std::numeric_limits<sheetsapi::idx_t>::max();

	REQUIRE(BuildA1Notation(std::nullopt, lastIndex - 1, std::nullopt, lastIndex - 1) ==
	        "18446744073709551615:18446744073709551615");
	REQUIRE_THROWS_AS(BuildA1Notation(0, lastIndex, 0, std::nullopt), sheetsapi::RowOutOfRangeException);
	REQUIRE_THROWS_AS(BuildA1Notation(std::nullopt, 0, std::nullopt, lastIndex), sheetsapi::RowOutOfRangeException);
	REQUIRE_THROWS_AS(BuildA1Notation(std::nullopt, 0, 2, lastIndex), sheetsapi::RowOutOfRangeException);

	try {
		BuildA1Notation(0, 0, 1, lastIndex);
		FAIL("expected RowOutOfRangeException");
	} catch (const sheetsapi::RowOutOfRangeException &e) {
		REQUIRE(e.GetRow() == lastIndex);
	}
}
