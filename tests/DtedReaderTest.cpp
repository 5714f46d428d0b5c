#include <catch2/catch.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

#include "DtedReader.hpp"
#include "DtedError.hpp"
#include "DtedTestData.hpp"

static std::string writeTempFile(const std::string& name, const std::vector<uint8_t>& bytes) {
	std::string path = (std::filesystem::temp_directory_path() / name).string();
	std::ofstream out(path, std::ios::binary);
	out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
	return path;
}

TEST_CASE("Reading a DTED file from disk", "[reader]") {
	testdata::HeaderSpec spec;
	spec.accuracy = "0025";
	spec.latCount = 5;
	spec.lonCount = 4;
	std::vector<uint8_t> bytes = testdata::buildFile(spec, [](int lon, int lat) { return lon * 100 + lat; });
	std::string path = writeTempFile("dted_reader_test.dt1", bytes);

	SECTION("raw bytes") {
		REQUIRE(readFileBytes(path) == bytes);
		REQUIRE(readFileBytes(path, 80).size() == 80);
	}

	SECTION("whole file") {
		DtedFile file = readDtedFile(path);
		REQUIRE(file.records.size() == 4);
		REQUIRE(file.records[3].elevations[4] == 304);
		REQUIRE(file.header.accuracy == std::optional<uint16_t>(25));
	}

	SECTION("header only") {
		DtedHeader header = readDtedHeader(path);
		REQUIRE(header.count.lat == 5);
		REQUIRE(header.count.lon == 4);
		REQUIRE(header.origin.lat == Angle(42, 0, 0.0));
	}

	std::remove(path.c_str());
}

TEST_CASE("Reading a missing file reports an I/O error", "[reader]") {
	try {
		readDtedFile("/nonexistent-dir/n00e000.dt1");
		FAIL("expected DtedError");
	} catch (const DtedError& e) {
		REQUIRE(e.kind() == DtedErrorKind::Io);
		REQUIRE_FALSE(e.hasOffset());
	}
	REQUIRE_THROWS_AS(readDtedHeader("/nonexistent-dir/n00e000.dt1"), DtedError);
}

TEST_CASE("Reading a truncated file reports incomplete input", "[reader]") {
	std::vector<uint8_t> bytes = testdata::buildHeader(testdata::HeaderSpec());
	bytes.resize(40);
	std::string path = writeTempFile("dted_reader_short.dt1", bytes);

	try {
		readDtedHeader(path);
		FAIL("expected DtedError");
	} catch (const DtedError& e) {
		REQUIRE(e.kind() == DtedErrorKind::IncompleteInput);
	}
	std::remove(path.c_str());
}
