/**
 * Author: Joshua Miller
 * Class: ECE6122 (Q)
 * Last Date Modified: 2026-10-19
 * 
 * @file ServerConfig.hpp
 * @brief ServerConfig struct and JSON loading
 */

#pragma once

#include <string>

#include "DtedFile.hpp"
#include "Logger.hpp"

/**
 * @brief ServerConfig struct
 * @details Settings for the terrain server and the command line tool.
 */
struct ServerConfig
{
    std::string dtedFile;
    int port = 5555;
    std::string logFile;
    LogLevel logLevel = LogLevel::Info;
    DecodeOptions decode;
    bool voidAsMissing = false;
};

bool isValidPort(int port);
int parsePort(const std::string& text);
ServerConfig parseServerConfig(const std::string& jsonText);
ServerConfig loadServerConfig(const std::string& path);
void applyLogging(const ServerConfig& config);
