#include <catch2/catch.hpp>

#include "DtedHeader.hpp"
#include "DtedError.hpp"
#include "DtedTestData.hpp"

TEST_CASE("User header label decodes known values", "[header]") {
	testdata::HeaderSpec spec;
	spec.lonCount = 3601;
	spec.latCount = 3601;
	std::vector<uint8_t> bytes = testdata::buildHeader(spec);
	REQUIRE(bytes.size() == DTED_UHL_LENGTH);

	DtedHeader header = decodeDtedHeader(bytes);
	REQUIRE(header.origin.lat == Angle(42, 0, 0.0));
	REQUIRE(header.origin.lon == Angle(15, 0, 0.0));
	REQUIRE(header.interval.lat == 10);
	REQUIRE(header.interval.lon == 10);
	REQUIRE(header.count.lat == 3601);
	REQUIRE(header.count.lon == 3601);
	REQUIRE_FALSE(header.accuracy.has_value());
	REQUIRE(header.securityCode == "U");
	REQUIRE(header.uniqueReference.empty());
	REQUIRE_FALSE(header.multipleAccuracy);
}

TEST_CASE("User header label with accuracy and southern/western origin", "[header]") {
	testdata::HeaderSpec spec;
	spec.lon = "1173015W";
	spec.lat = "0330000S";
	spec.lonIntervalTenths = 30;
	spec.latIntervalTenths = 10;
	spec.accuracy = "0025";
	spec.uniqueReference = "REF-0001    ";
	spec.lonCount = 1201;
	spec.latCount = 3601;
	spec.multipleAccuracy = '1';

	DtedHeader header = decodeDtedHeader(testdata::buildHeader(spec));
	REQUIRE(header.origin.lon == Angle(117, 30, 15.0, true));
	REQUIRE(header.origin.lat == Angle(33, 0, 0.0, true));
	REQUIRE(header.interval.lon == 30);
	REQUIRE(header.interval.lat == 10);
	REQUIRE(header.accuracy.has_value());
	REQUIRE(*header.accuracy == 25);
	REQUIRE(header.uniqueReference == "REF-0001");
	REQUIRE(header.count.lon == 1201);
	REQUIRE(header.count.lat == 3601);
	REQUIRE(header.multipleAccuracy);
}

TEST_CASE("User header label failures", "[header]") {
	testdata::HeaderSpec spec;

	SECTION("truncated input") {
		std::vector<uint8_t> bytes = testdata::buildHeader(spec);
		bytes.resize(79);
		try {
			decodeDtedHeader(bytes);
			FAIL("expected DtedError");
		} catch (const DtedError& e) {
			REQUIRE(e.kind() == DtedErrorKind::IncompleteInput);
		}
	}

	SECTION("wrong sentinel") {
		std::vector<uint8_t> bytes = testdata::buildHeader(spec);
		bytes[3] = '2';
		try {
			decodeDtedHeader(bytes);
			FAIL("expected DtedError");
		} catch (const DtedError& e) {
			REQUIRE(e.kind() == DtedErrorKind::StructuralMismatch);
			REQUIRE(e.offset() == 0);
		}
	}

	SECTION("non-digit count") {
		std::vector<uint8_t> bytes = testdata::buildHeader(spec);
		bytes[48] = 'x';
		try {
			decodeDtedHeader(bytes);
			FAIL("expected DtedError");
		} catch (const DtedError& e) {
			REQUIRE(e.kind() == DtedErrorKind::ValueDomain);
			REQUIRE(e.offset() == 48);
		}
	}

	SECTION("minutes out of range") {
		spec.lat = "0426100N";
		REQUIRE_THROWS_AS(decodeDtedHeader(testdata::buildHeader(spec)), DtedError);
	}

	SECTION("east/west letter in the latitude slot") {
		spec.lat = "0420000E";
		try {
			decodeDtedHeader(testdata::buildHeader(spec));
			FAIL("expected DtedError");
		} catch (const DtedError& e) {
			REQUIRE(e.kind() == DtedErrorKind::StructuralMismatch);
			REQUIRE(e.hasOffset());
			REQUIRE(e.offset() == 19);
		}
	}

	SECTION("north/south letter in the longitude slot") {
		spec.lon = "0150000S";
		try {
			decodeDtedHeader(testdata::buildHeader(spec));
			FAIL("expected DtedError");
		} catch (const DtedError& e) {
			REQUIRE(e.kind() == DtedErrorKind::StructuralMismatch);
			REQUIRE(e.offset() == 11);
		}
	}
}

TEST_CASE("Header decode consumes exactly 80 bytes", "[header]") {
	std::vector<uint8_t> bytes = testdata::buildHeader(testdata::HeaderSpec());
	bytes.push_back('Z');
	ByteCursor cursor(bytes);
	decodeDtedHeader(cursor);
	REQUIRE(cursor.offset() == 80);
	REQUIRE(cursor.remaining() == 1);
}
