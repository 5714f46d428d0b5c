#include <catch2/catch.hpp>

#include <stdexcept>
#include <string>

#include "ServerConfig.hpp"

TEST_CASE("Config defaults", "[config]") {
	ServerConfig config = parseServerConfig("{}");
	REQUIRE(config.dtedFile.empty());
	REQUIRE(config.port == 5555);
	REQUIRE(config.logFile.empty());
	REQUIRE(config.logLevel == LogLevel::Info);
	REQUIRE(config.decode.checksumPolicy == ChecksumPolicy::Ignore);
	REQUIRE_FALSE(config.decode.verifySectionSentinels);
	REQUIRE_FALSE(config.voidAsMissing);
}

TEST_CASE("Config reads every key", "[config]") {
	ServerConfig config = parseServerConfig(R"({
		"dted_file": "n42e015.dt1",
		"port": 6000,
		"log_file": "server.log",
		"log_level": "debug",
		"checksum_policy": "reject",
		"verify_section_sentinels": true,
		"void_as_missing": true
	})");

	REQUIRE(config.dtedFile == "n42e015.dt1");
	REQUIRE(config.port == 6000);
	REQUIRE(config.logFile == "server.log");
	REQUIRE(config.logLevel == LogLevel::Debug);
	REQUIRE(config.decode.checksumPolicy == ChecksumPolicy::Reject);
	REQUIRE(config.decode.verifySectionSentinels);
	REQUIRE(config.voidAsMissing);
}

TEST_CASE("Config rejects bad documents", "[config]") {
	REQUIRE_THROWS_AS(parseServerConfig("{ not json"), std::runtime_error);
	REQUIRE_THROWS_AS(parseServerConfig("[1, 2]"), std::runtime_error);
	REQUIRE_THROWS_AS(parseServerConfig(R"({"port": "eighty"})"), std::runtime_error);
	REQUIRE_THROWS_AS(parseServerConfig(R"({"port": 0})"), std::runtime_error);
	REQUIRE_THROWS_AS(parseServerConfig(R"({"port": 70000})"), std::runtime_error);
	REQUIRE_THROWS_AS(parseServerConfig(R"({"log_level": "loud"})"), std::runtime_error);
	REQUIRE_THROWS_AS(parseServerConfig(R"({"checksum_policy": "sometimes"})"), std::runtime_error);
	REQUIRE_THROWS_AS(loadServerConfig("/nonexistent-dir/config.json"), std::runtime_error);
}

TEST_CASE("Policy and level names", "[config]") {
	REQUIRE(parseChecksumPolicy("warn") == ChecksumPolicy::Warn);
	REQUIRE(std::string(toString(ChecksumPolicy::Reject)) == "reject");
	REQUIRE(parseLogLevel("warning") == LogLevel::Warn);
	REQUIRE(parseLogLevel("error") == LogLevel::Error);
	REQUIRE_THROWS_AS(parseLogLevel("verbose"), std::invalid_argument);
}

static std::string configErrorFor(const std::string& jsonText) {
	try {
		parseServerConfig(jsonText);
	} catch (const std::runtime_error& e) {
		return e.what();
	}
	FAIL("expected std::runtime_error");
	return std::string();
}

TEST_CASE("Config errors name the offending key", "[config]") {
	REQUIRE(configErrorFor(R"({"log_level": "loud"})").find("'log_level'") != std::string::npos);
	REQUIRE(configErrorFor(R"({"checksum_policy": "sometimes"})").find("'checksum_policy'") != std::string::npos);
	REQUIRE(configErrorFor(R"({"port": 70000})").find("'port'") != std::string::npos);
	REQUIRE(configErrorFor(R"({"void_as_missing": "yes"})").find("'void_as_missing'") != std::string::npos);
}

TEST_CASE("Port numbers from the command line", "[config]") {
	REQUIRE(parsePort("5555") == 5555);
	REQUIRE(parsePort("1") == 1);
	REQUIRE(parsePort("65535") == 65535);
	REQUIRE(isValidPort(6000));
	REQUIRE_FALSE(isValidPort(0));

	REQUIRE_THROWS_AS(parsePort("70000"), std::invalid_argument);
	REQUIRE_THROWS_AS(parsePort("0"), std::invalid_argument);
	REQUIRE_THROWS_AS(parsePort("-1"), std::invalid_argument);
	REQUIRE_THROWS_AS(parsePort("80x"), std::invalid_argument);
	REQUIRE_THROWS_AS(parsePort("http"), std::invalid_argument);
	REQUIRE_THROWS_AS(parsePort("99999999999"), std::invalid_argument);
}
