/**
 * Author: Joshua Miller
 * Class: ECE6122 (Q)
 * Last Date Modified: 2026-10-19
 * 
 * @file Logger.cpp
 * @brief Logger class implementation
 */

#include "Logger.hpp"

#include <sstream>
#include <fstream>
#include <string>
#include <iostream>
#include <chrono>
#include <ctime>
#include <stdexcept>

/**
 * @brief Check if file exists
 * @param filename - Name of file to check
 */
static bool fileExists(const std::string& filename)
{
    std::ifstream infile(filename);
    return infile.good();
}

/**
 * @brief Parse a level name (debug, info, warn, error)
 * @param name - Level name
 * @return Log level
 */
LogLevel parseLogLevel(const std::string& name)
{
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    throw std::invalid_argument("unknown log level: " + name);
}

/**
 * @brief Get tag printed for a level
 */
const char* toString(LogLevel level)
{
    switch (level)
    {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

/**
 * @brief Constructor for console-only Logger
 */
Logger::Logger()
    : level_(LogLevel::Info)
{
}

/**
 * @brief Open a log file, numbering the name if it already exists
 * @param baseFilename - Base name of log file
 */
void Logger::openFile(const std::string& baseFilename)
{
    std::string filename = baseFilename;
    size_t count = 1;

    // Check if file exists and increment filename
    while (fileExists(filename))
    {
        // Insert count before file extension
        // Assume extension like ".log"
        auto dotPos = baseFilename.rfind('.');
        std::ostringstream oss;
        if (dotPos == std::string::npos)
        {
            oss << baseFilename << count; // No extension
        }
        else
        {
            oss << baseFilename.substr(0, dotPos) << count << baseFilename.substr(dotPos);
        }
        filename = oss.str();
        count++;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (logFile_.is_open())
    {
        logFile_.close();
    }
    logFile_.open(filename, std::ios::app); // Now open new file
    filename_ = filename;
}

/**
 * @brief Set the lowest level that is written
 */
void Logger::setLevel(LogLevel level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

/**
 * @brief Get the current threshold
 */
LogLevel Logger::level() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

/**
 * @brief Check whether a message at this level would be written
 */
bool Logger::enabled(LogLevel level) const
{
    return static_cast<int>(level) >= static_cast<int>(this->level());
}

/**
 * @brief Log message to console and file
 * @param level - Message severity
 * @param message - Message to log
 */
void Logger::log(LogLevel level, const std::string& message)
{
    if (!enabled(level))
    {
        return;
    }

    std::string line = timestamp() + " [" + toString(level) + "] " + message;

    std::lock_guard<std::mutex> lock(mutex_);
    std::clog << line << "\n";
    if (logFile_.is_open())
    {
        logFile_ << line << "\n";
        logFile_.flush();
    }
}

/**
 * @brief Get current timestamp as string
 * @return Timestamp string in format [YYYY-MM-DD HH:MM:SS]
 */
std::string Logger::timestamp()
{
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf;
    localtime_r(&now_c, &tm_buf);
    char buf[20];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return std::string("[") + buf + "]";
}

Logger logger;
