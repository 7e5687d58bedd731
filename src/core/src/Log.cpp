/**
 * @file Log.cpp
 * @brief Default ILogger implementation writing to stderr.
 *
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "sbr/core/Log.hpp"

#include <atomic>
#include <cstdio>
#include <mutex>

namespace sbr::core {

namespace {

class StderrLogger final : public ILogger {
public:
    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        const auto name = toString(level);

        // one line per call even with render and team threads interleaving
        std::lock_guard<std::mutex> lock{_mutex};
        std::fprintf(
            stderr,
            "[%.*s][%.*s] %.*s\n",
            static_cast<int>(name.size()), name.data(),
            static_cast<int>(tag.size()), tag.data(),
            static_cast<int>(message.size()), message.data()
        );
    }

private:
    std::mutex _mutex;
};

StderrLogger           gDefaultLogger;
std::atomic<ILogger *> gActiveLogger{&gDefaultLogger};
std::atomic<LogLevel>  gMinLevel{LogLevel::kInfo};

} // anonymous namespace

std::string_view toString(LogLevel level) noexcept
{
    switch (level)
    {
    case LogLevel::kDebug: return "DEBUG";
    case LogLevel::kInfo:  return "INFO ";
    case LogLevel::kWarn:  return "WARN ";
    case LogLevel::kError: return "ERROR";
    case LogLevel::kFatal: return "FATAL";
    }
    return "?????";
}

void Log::setLogger(ILogger *logger)
{
    gActiveLogger.store(logger ? logger : &gDefaultLogger, std::memory_order_release);
}

ILogger *Log::logger() { return gActiveLogger.load(std::memory_order_acquire); }

void Log::setMinLevel(LogLevel level) { gMinLevel.store(level, std::memory_order_relaxed); }
LogLevel Log::minLevel()              { return gMinLevel.load(std::memory_order_relaxed); }
bool Log::enabled(LogLevel level)     { return level >= minLevel(); }

static void dispatch(LogLevel level, std::string_view tag, std::string_view msg)
{
    if (!Log::enabled(level))
        return;
    gActiveLogger.load(std::memory_order_acquire)->write(level, tag, msg);
}

void Log::debug(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kDebug, tag, msg); }
void Log::info (std::string_view tag, std::string_view msg) { dispatch(LogLevel::kInfo,  tag, msg); }
void Log::warn (std::string_view tag, std::string_view msg) { dispatch(LogLevel::kWarn,  tag, msg); }
void Log::error(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kError, tag, msg); }
void Log::fatal(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kFatal, tag, msg); }

ScopedLogSink::ScopedLogSink(ILogger &sink, LogLevel level)
    : _previous(Log::logger())
    , _previousLevel(Log::minLevel())
{
    Log::setLogger(&sink);
    Log::setMinLevel(level);
}

ScopedLogSink::~ScopedLogSink()
{
    Log::setLogger(_previous);
    Log::setMinLevel(_previousLevel);
}

} // namespace sbr::core
