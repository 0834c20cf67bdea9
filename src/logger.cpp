/**
 * @file logger.cpp
 * @brief Logger static state and level name helpers
 */

#include "logger.h"
#include <algorithm>
#include <cctype>

LogLevel Logger::s_minLevel = LogLevel::INFO;
bool Logger::s_useColors = true;
std::mutex Logger::s_mutex;

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
    }
    return "UNKNOWN";
}

LogLevel Logger::parseLevel(const std::string& name, LogLevel fallback) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARNING" || upper == "WARN") return LogLevel::WARNING;
    if (upper == "ERROR") return LogLevel::ERROR;
    return fallback;
}
