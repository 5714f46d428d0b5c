/**
 * Author: Joshua Miller
 * Class: ECE6122 (Q)
 * Last Date Modified: 2026-10-19
 * 
 * @file Logger.hpp
 */

#pragma once

#include <string>
#include <fstream>
#include <mutex>

/**
 * @brief Severity of a log message
 */
enum class LogLevel
{
    Debug = 0,
    Info,
    Warn,
    Error
};

LogLevel parseLogLevel(const std::string& name);
const char* toString(LogLevel level);

/**
 * @brief Logger class
 * 
 * @details This class provides simple logging functionality to log messages to the console
 * and optionally a file, with timestamps and a level threshold.
 */
class Logger
{
    public:
        Logger();

        void openFile(const std::string& baseFilename);
        void setLevel(LogLevel level);
        LogLevel level() const;
        bool enabled(LogLevel level) const;

        void log(LogLevel level, const std::string& message);
        void debug(const std::string& message) { log(LogLevel::Debug, message); }
        void info(const std::string& message) { log(LogLevel::Info, message); }
        void warn(const std::string& message) { log(LogLevel::Warn, message); }
        void error(const std::string& message) { log(LogLevel::Error, message); }

    private:
        std::string timestamp();

        std::ofstream logFile_;
        std::string filename_;
        LogLevel level_;
        mutable std::mutex mutex_;
};

extern Logger logger;
