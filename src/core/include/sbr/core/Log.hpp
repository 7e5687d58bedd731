/**
 * @file Log.hpp
 * @brief Logging façade with runtime severity filtering.
 *
 * A static Log class forwards to an injectable ILogger.  The default sink
 * writes `[LEVEL][tag] message` lines to stderr; tests and embedding
 * servers install their own sink through Log::setLogger().
 *
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SBR_CORE_LOG_HPP
    #define SBR_CORE_LOG_HPP

    #include "NonCopyable.hpp"
    #include "Types.hpp"

    #include <string_view>

namespace sbr::core {

enum class LogLevel : u8 {
    kDebug = 0,
    kInfo,
    kWarn,
    kError,
    kFatal
};

/// @brief Fixed-width upper-case name ("DEBUG", "INFO ", ...).
[[nodiscard]] std::string_view toString(LogLevel level) noexcept;

/**
 * @brief Destination of every log line.
 *
 * The render thread and team-update callers log concurrently, so an
 * implementation must serialise its own output.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    /// @param tag Subsystem tag ("SIDEBAR", "SCOREBOARD", "NET").
    virtual void write(LogLevel level, std::string_view tag, std::string_view message) = 0;
};

/**
 * @brief Static logging façade used throughout ScoreBridge.
 *
 * All methods are thread-safe provided the installed ILogger is thread-safe.
 */
class Log final {
public:
    Log() = delete;

    /// @brief Installs @p logger; nullptr restores the stderr sink.
    static void setLogger(ILogger *logger);
    [[nodiscard]] static ILogger *logger();
    static void setMinLevel(LogLevel level);
    [[nodiscard]] static LogLevel minLevel();

    /// @brief Cheap pre-check so callers can skip building a message.
    [[nodiscard]] static bool enabled(LogLevel level);

    static void debug(std::string_view tag, std::string_view msg);
    static void info (std::string_view tag, std::string_view msg);
    static void warn (std::string_view tag, std::string_view msg);
    static void error(std::string_view tag, std::string_view msg);
    static void fatal(std::string_view tag, std::string_view msg);

    static void debug(std::string_view msg) { debug("sbr", msg); }
    static void info (std::string_view msg) { info ("sbr", msg); }
    static void warn (std::string_view msg) { warn ("sbr", msg); }
    static void error(std::string_view msg) { error("sbr", msg); }
    static void fatal(std::string_view msg) { fatal("sbr", msg); }
};

/**
 * @brief Routes logging to @p sink at @p level until the end of the scope.
 *
 * Restores the previous sink and level on destruction.  Scopes must nest.
 */
class ScopedLogSink final : public NonMovable<ScopedLogSink> {
public:
    ScopedLogSink(ILogger &sink, LogLevel level);
    ~ScopedLogSink();

private:
    ILogger *_previous;
    LogLevel _previousLevel;
};

} // namespace sbr::core

#endif // SBR_CORE_LOG_HPP
