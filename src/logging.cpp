// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <cctype>
#include <chatconsole/logging.hpp>
#include <iostream>

namespace chatconsole
{

std::optional<LogLevel> parse_log_level(const std::string& name)
{
    std::string lower = name;
    std::transform(
        lower.begin(),
        lower.end(),
        lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); }
    );

    if (lower == "debug" || lower == "all")
        return LogLevel::Debug;
    if (lower == "info")
        return LogLevel::Info;
    if (lower == "warning" || lower == "warn")
        return LogLevel::Warning;
    if (lower == "error")
        return LogLevel::Error;
    if (lower == "none")
        return LogLevel::None;
    return std::nullopt;
}

const char* to_string(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warning:
        return "warning";
    case LogLevel::Error:
        return "error";
    case LogLevel::None:
        return "none";
    }
    return "info";
}

Logger& Logger::get()
{
    static Logger instance;
    return instance;
}

void Logger::set_level(LogLevel level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::level() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::set_sink(std::ostream* sink)
{
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = sink;
}

bool Logger::enabled(LogLevel level) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return level != LogLevel::None && level >= level_;
}

void Logger::log(LogLevel level, const std::string& message)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (level == LogLevel::None || level < level_)
        return;
    std::ostream& out = sink_ ? *sink_ : std::cerr;
    out << "[" << to_string(level) << "] " << message << std::endl;
}

} // namespace chatconsole
