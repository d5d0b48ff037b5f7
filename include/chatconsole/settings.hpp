// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file settings.hpp
/// @brief Console configuration loaded from appsettings.json and the environment

#include <chatconsole/bridge_client.hpp>
#include <chatconsole/logging.hpp>
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace chatconsole
{

/// Exception thrown for unreadable or invalid settings
class SettingsError : public std::runtime_error
{
  public:
    explicit SettingsError(const std::string& message) : std::runtime_error(message) {}
};

/// Input and output workbook names for batch runs
struct BatchSettings
{
    std::string questions_file = "questions.xlsx";
    std::string questions_sheet = "Questions";
    std::string results_sheet = "Results";

    /// Output file is `<prefix><yyyy-MM-dd_HH-mm-ss>.xlsx`
    std::string output_prefix = "Response_";
};

/// Everything the console reads from configuration
///
/// File layout (all keys optional):
/// @code
/// {
///   "logLevel": "info",
///   "modeTimeoutSeconds": 15,
///   "batch": { "questionsFile": "questions.xlsx", "questionsSheet": "Questions",
///              "resultsSheet": "Results", "outputPrefix": "Response_" },
///   "bridge": { "command": "...", "args": [], "cwd": "...", "environment": {},
///               "startupTimeoutMs": 30000 },
///   "connection": { "environmentId": "...", "schemaName": "...", ... }
/// }
/// @endcode
struct ConsoleSettings
{
    LogLevel log_level = LogLevel::Info;
    std::chrono::seconds mode_timeout{15};
    BatchSettings batch;
    BridgeOptions bridge;

    // ─────────────────────────────────────────────────────────────────────────
    // Environment Variable Support
    // ─────────────────────────────────────────────────────────────────────────

    static constexpr const char* ENV_BRIDGE_PATH = "CHATCONSOLE_BRIDGE_PATH";
    static constexpr const char* ENV_LOG_LEVEL = "CHATCONSOLE_LOG_LEVEL";
    static constexpr const char* ENV_ENVIRONMENT_ID = "CHATCONSOLE_ENVIRONMENT_ID";
    static constexpr const char* ENV_SCHEMA_NAME = "CHATCONSOLE_SCHEMA_NAME";

    /// Load settings from a JSON file
    /// @param path Settings file
    /// @param required Throw when the file does not exist (otherwise defaults are returned)
    /// @throws SettingsError if the file is unreadable or invalid
    static ConsoleSettings load(const std::filesystem::path& path, bool required = false);

    /// Parse settings from a JSON document
    /// @throws SettingsError on invalid values
    static ConsoleSettings from_json(const json& j);

    /// Overlay CHATCONSOLE_* environment variables
    /// @throws SettingsError if CHATCONSOLE_LOG_LEVEL is not a level name
    void apply_environment();
};

} // namespace chatconsole
