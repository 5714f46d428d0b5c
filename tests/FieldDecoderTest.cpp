#include <catch2/catch.hpp>

#include <string>
#include <vector>

#include "FieldDecoder.hpp"
#include "DtedError.hpp"

static std::vector<uint8_t> bytesOf(const std::string& text) {
	return std::vector<uint8_t>(text.begin(), text.end());
}

TEST_CASE("Signed magnitude decoding", "[fields]") {
	REQUIRE(signedMagnitudeToInt(0x0000) == 0);
	REQUIRE(signedMagnitudeToInt(0x0003) == 3);
	REQUIRE(signedMagnitudeToInt(0x8003) == -3);
	REQUIRE(signedMagnitudeToInt(0x7fff) == 32767);
	REQUIRE(signedMagnitudeToInt(0xffff) == -32767);
	REQUIRE(signedMagnitudeToInt(0x8000) == 0);

	std::vector<uint8_t> buf = { 0x80, 0x03, 0x01, 0x2c };
	ByteCursor cursor(buf);
	REQUIRE(decodeSignedMagnitude(cursor) == -3);
	REQUIRE(decodeSignedMagnitude(cursor) == 300);
	REQUIRE(cursor.atEnd());
	REQUIRE_THROWS_AS(decodeSignedMagnitude(cursor), DtedError);
}

TEST_CASE("NA-aware optional unsigned", "[fields]") {
	std::vector<uint8_t> na = bytesOf("NA$$");
	ByteCursor naCursor(na);
	REQUIRE_FALSE(decodeOptionalUnsigned(naCursor).has_value());
	REQUIRE(naCursor.atEnd());

	std::vector<uint8_t> present = bytesOf("1234");
	ByteCursor presentCursor(present);
	std::optional<uint16_t> value = decodeOptionalUnsigned(presentCursor);
	REQUIRE(value.has_value());
	REQUIRE(*value == 1234);

	std::vector<uint8_t> bad = bytesOf("12X4");
	ByteCursor badCursor(bad);
	REQUIRE_THROWS_AS(decodeOptionalUnsigned(badCursor), DtedError);
}

TEST_CASE("Fixed-width unsigned decimal", "[fields]") {
	std::vector<uint8_t> buf = bytesOf("0420159");
	ByteCursor cursor(buf);
	REQUIRE(decodeUnsigned(cursor, 3) == 42);
	REQUIRE(decodeUnsigned(cursor, 0, 7) == 7);
	REQUIRE(cursor.offset() == 3);
	REQUIRE(decodeUnsigned(cursor, 4) == 159);
	REQUIRE(cursor.atEnd());

	std::vector<uint8_t> bad = bytesOf("0 12");
	ByteCursor badCursor(bad);
	try {
		decodeUnsigned(badCursor, 4);
		FAIL("expected DtedError");
	} catch (const DtedError& e) {
		REQUIRE(e.kind() == DtedErrorKind::ValueDomain);
		REQUIRE(e.offset() == 1);
	}

	std::vector<uint8_t> shortBuf = bytesOf("12");
	ByteCursor shortCursor(shortBuf);
	try {
		decodeUnsigned(shortCursor, 4);
		FAIL("expected DtedError");
	} catch (const DtedError& e) {
		REQUIRE(e.kind() == DtedErrorKind::IncompleteInput);
	}
	REQUIRE(shortCursor.offset() == 0);
}

TEST_CASE("Tag matching", "[fields]") {
	std::vector<uint8_t> buf = bytesOf("UHL1DSIUACC");
	buf.push_back(0xAA);
	buf.push_back('N');
	buf.push_back('A');
	ByteCursor cursor(buf);

	REQUIRE_NOTHROW(matchTag(cursor, Sentinel::UHL));
	REQUIRE_NOTHROW(matchTag(cursor, Sentinel::DSI));
	REQUIRE_NOTHROW(matchTag(cursor, Sentinel::ACC));
	REQUIRE_NOTHROW(matchTag(cursor, Sentinel::DATA));

	try {
		matchTag(cursor, Sentinel::UHL);
		FAIL("expected DtedError");
	} catch (const DtedError& e) {
		REQUIRE(e.kind() == DtedErrorKind::IncompleteInput);
	}

	REQUIRE_THROWS_AS(matchTag(cursor, Sentinel::DATA), DtedError);
	REQUIRE(cursor.offset() == 12);
	REQUIRE_NOTHROW(matchTag(cursor, Sentinel::NA));
	REQUIRE(cursor.atEnd());

	std::vector<uint8_t> wrong = bytesOf("UHL2");
	ByteCursor wrongCursor(wrong);
	try {
		matchTag(wrongCursor, Sentinel::UHL);
		FAIL("expected DtedError");
	} catch (const DtedError& e) {
		REQUIRE(e.kind() == DtedErrorKind::StructuralMismatch);
	}
}

TEST_CASE("Hemisphere and angle fields", "[fields]") {
	std::vector<uint8_t> buf = bytesOf("NESW X");
	ByteCursor cursor(buf);
	REQUIRE(decodeHemisphere(cursor) == 1);
	REQUIRE(decodeHemisphere(cursor) == 1);
	REQUIRE(decodeHemisphere(cursor) == -1);
	REQUIRE(decodeHemisphere(cursor) == -1);
	REQUIRE(decodeHemisphere(cursor) == 1);
	REQUIRE_THROWS_AS(decodeHemisphere(cursor), DtedError);

	std::vector<uint8_t> axisBuf = bytesOf("SW NE");
	ByteCursor axisCursor(axisBuf);
	REQUIRE(decodeHemisphere(axisCursor, Hemisphere::Latitude) == -1);
	REQUIRE(decodeHemisphere(axisCursor, Hemisphere::Longitude) == -1);
	REQUIRE(decodeHemisphere(axisCursor, Hemisphere::Latitude) == 1);
	try {
		decodeHemisphere(axisCursor, Hemisphere::Longitude);
		FAIL("expected DtedError");
	} catch (const DtedError& e) {
		REQUIRE(e.kind() == DtedErrorKind::StructuralMismatch);
		REQUIRE(e.offset() == 3);
	}
	REQUIRE_THROWS_AS(decodeHemisphere(axisCursor, Hemisphere::Latitude), DtedError);

	std::vector<uint8_t> angles = bytesOf("0153045W0420000N0016000S");
	ByteCursor angleCursor(angles);
	REQUIRE(decodeAngle(angleCursor, 3, 2, 2) == Angle(15, 30, 45.0, true));
	REQUIRE(decodeAngle(angleCursor, 3, 2, 2) == Angle(42, 0, 0.0, false));
	try {
		decodeAngle(angleCursor, 3, 2, 2);
		FAIL("expected DtedError");
	} catch (const DtedError& e) {
		REQUIRE(e.kind() == DtedErrorKind::ValueDomain);
		REQUIRE(e.offset() == 16);
	}
}

TEST_CASE("Big-endian words and text", "[fields]") {
	std::vector<uint8_t> buf = { 0x01, 0x02, 0xde, 0xad, 0xbe, 0xef, 'U', ' ', ' ' };
	ByteCursor cursor(buf);
	REQUIRE(decodeU16(cursor) == 0x0102);
	REQUIRE(decodeU32(cursor) == 0xdeadbeefu);
	REQUIRE(decodeText(cursor, 3) == "U");
	REQUIRE(cursor.remaining() == 0);
}
