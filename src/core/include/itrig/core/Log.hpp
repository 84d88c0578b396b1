/**
 * @file Log.hpp
 * @brief Minimal logging façade with runtime severity filtering.
 *
 * Provides a static Log class backed by an injectable ILogger interface.
 * The default implementation writes to stderr.  A custom logger can be
 * installed via Log::setLogger() at program startup.
 *
 * The runtime trig core never logs; the façade serves the table
 * generator and the command-line tools.
 *
 * @author IntTrig contributors
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ITRIG_CORE_LOG_HPP
    #define ITRIG_CORE_LOG_HPP

    #include "Types.hpp"

    #include <string_view>

namespace itrig::core {

/**
 * @brief Severity levels for log messages.
 */
enum class LogLevel : u8 {
    kDebug = 0,
    kInfo,
    kWarn,
    kError,
    kFatal
};

/**
 * @brief Abstract sink for log messages.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    /**
     * @brief Write a log entry.
     * @param level   Severity.
     * @param tag     Subsystem tag (e.g. "GEN", "CLI").
     * @param message Formatted message body.
     */
    virtual void write(LogLevel level, std::string_view tag, std::string_view message) = 0;
};

/**
 * @brief Static logging façade.
 *
 * Thread-safe provided the installed ILogger is thread-safe and the
 * logger/level are configured before concurrent use.
 */
class Log final {
public:
    Log() = delete;

    static void setLogger(ILogger *logger);
    static void setMinLevel(LogLevel level);
    [[nodiscard]] static LogLevel minLevel();

    static void debug(std::string_view tag, std::string_view msg);
    static void info (std::string_view tag, std::string_view msg);
    static void warn (std::string_view tag, std::string_view msg);
    static void error(std::string_view tag, std::string_view msg);
    static void fatal(std::string_view tag, std::string_view msg);

    static void debug(std::string_view msg) { debug("itrig", msg); }
    static void info (std::string_view msg) { info ("itrig", msg); }
    static void warn (std::string_view msg) { warn ("itrig", msg); }
    static void error(std::string_view msg) { error("itrig", msg); }
    static void fatal(std::string_view msg) { fatal("itrig", msg); }
};

} // namespace itrig::core

#endif // ITRIG_CORE_LOG_HPP
