// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file logging.hpp
/// @brief Process-wide diagnostic logger

#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>

namespace chatconsole
{

/// Diagnostic verbosity, ordered from most to least verbose
enum class LogLevel
{
    Debug,
    Info,
    Warning,
    Error,
    None
};

/// Parse a level name ("debug", "info", "warning", "error", "none"; "all" = debug)
std::optional<LogLevel> parse_log_level(const std::string& name);

/// Canonical name of a level, as passed to the agent bridge
const char* to_string(LogLevel level);

/// Shared logger; diagnostics go to stderr so they never mix with the console dialogue
class Logger
{
  public:
    static Logger& get();

    void set_level(LogLevel level);
    LogLevel level() const;

    /// Redirect output (nullptr restores stderr)
    void set_sink(std::ostream* sink);

    bool enabled(LogLevel level) const;

    void log(LogLevel level, const std::string& message);

  private:
    Logger() = default;

    mutable std::mutex mutex_;
    LogLevel level_ = LogLevel::Info;
    std::ostream* sink_ = nullptr;
};

} // namespace chatconsole

#define CHATCONSOLE_LOG(level, msg)                                                    \
    do                                                                                 \
    {                                                                                  \
        if (::chatconsole::Logger::get().enabled(level))                               \
            ::chatconsole::Logger::get().log(level, msg);                              \
    } while (0)

#define CHATCONSOLE_LOG_DEBUG(msg) CHATCONSOLE_LOG(::chatconsole::LogLevel::Debug, msg)
#define CHATCONSOLE_LOG_INFO(msg) CHATCONSOLE_LOG(::chatconsole::LogLevel::Info, msg)
#define CHATCONSOLE_LOG_WARN(msg) CHATCONSOLE_LOG(::chatconsole::LogLevel::Warning, msg)
#define CHATCONSOLE_LOG_ERROR(msg) CHATCONSOLE_LOG(::chatconsole::LogLevel::Error, msg)
