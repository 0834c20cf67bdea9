/**
 * @file logger.h
 * @brief Stream-style logging with severity levels for the voxel world core
 */

#pragma once

#include <iostream>
#include <sstream>
#include <string>
#include <mutex>

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,    ///< Per-chunk detail (generation, remesh, eviction)
    INFO,     ///< Lifecycle messages (settings loaded, retention pass summaries)
    WARNING,  ///< Recoverable problems (missing config, unknown manifest entries)
    ERROR     ///< Invariant violations and failed I/O
};

/**
 * @brief Thread-safe logger with severity levels
 *
 * Every message is accumulated in a LogStream and written in one piece when
 * the stream goes out of scope, so concurrent writers never interleave lines.
 * ERROR goes to stderr, everything else to stdout.
 *
 * Usage:
 * @code
 * Logger::info() << "Retention pass: " << created << " created, " << evicted << " evicted";
 * Logger::error() << "Chunk (" << c.x << ", " << c.y << ", " << c.z << ") is not loaded";
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Log stream that outputs when destroyed
     */
    class LogStream {
    public:
        LogStream(LogLevel level) : m_level(level) {}

        LogStream(LogStream&& other) noexcept
            : m_level(other.m_level), m_stream(std::move(other.m_stream)), m_active(other.m_active) {
            other.m_active = false;
        }

        ~LogStream() {
            if (!m_active || m_level < s_minLevel) {
                return;
            }

            std::lock_guard<std::mutex> lock(s_mutex);
            std::ostream& out = (m_level >= LogLevel::ERROR) ? std::cerr : std::cout;

            if (s_useColors) {
                switch (m_level) {
                    case LogLevel::DEBUG:   out << "\033[36m[DEBUG]\033[0m "; break;   // Cyan
                    case LogLevel::INFO:    out << "\033[32m[INFO]\033[0m "; break;    // Green
                    case LogLevel::WARNING: out << "\033[33m[WARNING]\033[0m "; break; // Yellow
                    case LogLevel::ERROR:   out << "\033[31m[ERROR]\033[0m "; break;   // Red
                }
            } else {
                out << "[" << levelName(m_level) << "] ";
            }

            out << m_stream.str() << std::endl;
        }

        /**
         * @brief Appends a value to the pending message
         * @tparam T Any type with an ostream operator
         */
        template<typename T>
        LogStream& operator<<(const T& value) {
            if (m_level >= s_minLevel) {
                m_stream << value;
            }
            return *this;
        }

    private:
        LogLevel m_level;              ///< Severity level of this message
        std::ostringstream m_stream;   ///< Accumulated message
        bool m_active = true;          ///< False once moved from
    };

    // ========== Static Logging Methods ==========

    static LogStream debug() { return LogStream(LogLevel::DEBUG); }
    static LogStream info() { return LogStream(LogLevel::INFO); }
    static LogStream warning() { return LogStream(LogLevel::WARNING); }
    static LogStream error() { return LogStream(LogLevel::ERROR); }

    // ========== Configuration ==========

    /**
     * @brief Sets the minimum log level; messages below it are dropped
     */
    static void setMinLevel(LogLevel level) {
        s_minLevel = level;
    }

    static LogLevel getMinLevel() {
        return s_minLevel;
    }

    /**
     * @brief Enables or disables ANSI color prefixes
     */
    static void setUseColors(bool enable) {
        s_useColors = enable;
    }

    /**
     * @brief Upper-case name of a level ("DEBUG", "INFO", ...)
     */
    static const char* levelName(LogLevel level);

    /**
     * @brief Parses a level name as written in config.ini
     *
     * Case-insensitive. "WARN" is accepted for WARNING.
     *
     * @param name Level name
     * @param fallback Returned when the name is not recognized
     * @return Parsed level or fallback
     */
    static LogLevel parseLevel(const std::string& name, LogLevel fallback = LogLevel::INFO);

private:
    static LogLevel s_minLevel;       ///< Minimum level to display
    static bool s_useColors;          ///< Whether to use ANSI colors
    static std::mutex s_mutex;        ///< Serializes output lines
};
