/**
 * Author: Joshua Miller
 * Class: ECE6122 (Q)
 * Last Date Modified: 2026-10-19
 * 
 * @file ServerConfig.cpp
 * @brief ServerConfig JSON loading
 */

#include "ServerConfig.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

/**
 * @brief Read an optional key, reporting type errors with the key name
 */
template <typename T>
static T valueOr(const json& j, const char* key, const T& fallback)
{
    try
    {
        return j.value(key, fallback);
    }
    catch (const json::exception& e)
    {
        throw std::runtime_error(std::string("config key '") + key + "': " + e.what());
    }
}

/**
 * @brief Check that a TCP port number is in 1..65535
 */
bool isValidPort(int port)
{
    return port > 0 && port <= 65535;
}

/**
 * @brief Parse a port number given on the command line
 * @param text Decimal port
 * @return Port, throws std::invalid_argument when not a number in 1..65535
 */
int parsePort(const std::string& text)
{
    std::size_t used = 0;
    int port = 0;
    try
    {
        port = std::stoi(text, &used);
    }
    catch (const std::logic_error&)
    {
        throw std::invalid_argument("port '" + text + "' is not a number");
    }
    if (used != text.size() || !isValidPort(port))
    {
        throw std::invalid_argument("port '" + text + "' is not a valid port");
    }
    return port;
}

/**
 * @brief Parse a JSON configuration document
 * @param jsonText JSON text
 * @return Configuration, unspecified keys keep their defaults
 */
ServerConfig parseServerConfig(const std::string& jsonText)
{
    json j;
    try
    {
        j = json::parse(jsonText);
    }
    catch (const json::parse_error& e)
    {
        throw std::runtime_error(std::string("malformed config: ") + e.what());
    }
    if (!j.is_object())
    {
        throw std::runtime_error("config must be a JSON object");
    }

    ServerConfig config;
    config.dtedFile = valueOr<std::string>(j, "dted_file", config.dtedFile);
    config.port = valueOr<int>(j, "port", config.port);
    config.logFile = valueOr<std::string>(j, "log_file", config.logFile);
    config.decode.verifySectionSentinels =
        valueOr<bool>(j, "verify_section_sentinels", config.decode.verifySectionSentinels);
    config.voidAsMissing = valueOr<bool>(j, "void_as_missing", config.voidAsMissing);

    try
    {
        config.logLevel = parseLogLevel(valueOr<std::string>(j, "log_level", "info"));
    }
    catch (const std::invalid_argument& e)
    {
        throw std::runtime_error(std::string("config key 'log_level': ") + e.what());
    }
    try
    {
        config.decode.checksumPolicy = parseChecksumPolicy(valueOr<std::string>(j, "checksum_policy", "ignore"));
    }
    catch (const std::invalid_argument& e)
    {
        throw std::runtime_error(std::string("config key 'checksum_policy': ") + e.what());
    }

    if (!isValidPort(config.port))
    {
        throw std::runtime_error("config key 'port': " + std::to_string(config.port) + " is not a valid port");
    }

    return config;
}

/**
 * @brief Load a JSON configuration file
 * @param path File path
 * @return Configuration
 */
ServerConfig loadServerConfig(const std::string& path)
{
    std::ifstream file(path);
    if (!file)
    {
        throw std::runtime_error("cannot open config file: " + path);
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return parseServerConfig(oss.str());
}

/**
 * @brief Apply the logging section of a configuration to the global logger
 */
void applyLogging(const ServerConfig& config)
{
    logger.setLevel(config.logLevel);
    if (!config.logFile.empty())
    {
        logger.openFile(config.logFile);
    }
}
