#include <catch2/catch.hpp>

#include "DtedRecord.hpp"
#include "DtedError.hpp"
#include "DtedTestData.hpp"

TEST_CASE("Record decodes block index, echoes and elevations", "[record]") {
	std::vector<uint8_t> bytes = testdata::buildRecord(0x012345, 7, { 0, 3, -3, 32767, -32767 });
	REQUIRE(bytes.size() == dtedRecordLength(5));

	ByteCursor cursor(bytes);
	DtedRecord record = decodeDtedRecord(cursor, 5);
	REQUIRE(record.blockIndex == 0x012345);
	REQUIRE(record.lonCount == 7);
	REQUIRE(record.latCount == 0);
	REQUIRE(record.elevations == std::vector<int16_t>{ 0, 3, -3, 32767, -32767 });
	REQUIRE(record.checksum == computeRecordChecksum(bytes.data(), bytes.size() - 4));
	REQUIRE(cursor.atEnd());
}

TEST_CASE("Record failures", "[record]") {
	std::vector<uint8_t> bytes = testdata::buildRecord(1, 1, { 10, 20, 30 });

	SECTION("bad sentinel") {
		bytes[0] = 0xAB;
		ByteCursor cursor(bytes);
		try {
			decodeDtedRecord(cursor, 3);
			FAIL("expected DtedError");
		} catch (const DtedError& e) {
			REQUIRE(e.kind() == DtedErrorKind::StructuralMismatch);
		}
	}

	SECTION("line length larger than the record") {
		ByteCursor cursor(bytes);
		try {
			decodeDtedRecord(cursor, 4);
			FAIL("expected DtedError");
		} catch (const DtedError& e) {
			REQUIRE(e.kind() == DtedErrorKind::IncompleteInput);
		}
	}

	SECTION("missing checksum") {
		bytes.resize(bytes.size() - 2);
		ByteCursor cursor(bytes);
		REQUIRE_THROWS_AS(decodeDtedRecord(cursor, 3), DtedError);
	}
}

TEST_CASE("Record checksum policies", "[record][checksum]") {
	std::vector<uint8_t> good = testdata::buildRecord(2, 2, { 100, -100 });
	std::vector<uint8_t> bad = testdata::buildRecord(2, 2, { 100, -100 }, true);

	ByteCursor goodCursor(good);
	REQUIRE_NOTHROW(decodeDtedRecord(goodCursor, 2, ChecksumPolicy::Reject));

	ByteCursor ignoreCursor(bad);
	REQUIRE_NOTHROW(decodeDtedRecord(ignoreCursor, 2, ChecksumPolicy::Ignore));

	ByteCursor warnCursor(bad);
	DtedRecord warned = decodeDtedRecord(warnCursor, 2, ChecksumPolicy::Warn);
	REQUIRE(warned.elevations == std::vector<int16_t>{ 100, -100 });

	ByteCursor rejectCursor(bad);
	try {
		decodeDtedRecord(rejectCursor, 2, ChecksumPolicy::Reject);
		FAIL("expected DtedError");
	} catch (const DtedError& e) {
		REQUIRE(e.kind() == DtedErrorKind::Checksum);
		REQUIRE(e.offset() == 0);
	}
}

TEST_CASE("Checksum policy names", "[record][checksum]") {
	REQUIRE(parseChecksumPolicy("ignore") == ChecksumPolicy::Ignore);
	REQUIRE(parseChecksumPolicy("warn") == ChecksumPolicy::Warn);
	REQUIRE(parseChecksumPolicy("reject") == ChecksumPolicy::Reject);
	REQUIRE(std::string(toString(ChecksumPolicy::Warn)) == "warn");
	REQUIRE_THROWS_AS(parseChecksumPolicy("strict"), std::invalid_argument);
}
