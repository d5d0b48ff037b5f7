// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <chatconsole/settings.hpp>
#include <cstdlib>
#include <fstream>

namespace chatconsole
{

namespace
{

const json* member(const json& j, const char* key)
{
    auto it = j.find(key);
    return it == j.end() || it->is_null() ? nullptr : &*it;
}

std::string string_member(const json& j, const char* key, const std::string& fallback)
{
    const json* value = member(j, key);
    if (!value)
        return fallback;
    if (!value->is_string())
        throw SettingsError(std::string("Setting '") + key + "' must be a string");
    return value->get<std::string>();
}

int64_t integer_member(const json& j, const char* key, int64_t fallback, int64_t min_value)
{
    const json* value = member(j, key);
    if (!value)
        return fallback;
    if (!value->is_number_integer() || value->get<int64_t>() < min_value)
        throw SettingsError(
            std::string("Setting '") + key + "' must be an integer >= " + std::to_string(min_value)
        );
    return value->get<int64_t>();
}

const json& object_member(const json& j, const char* key)
{
    static const json empty = json::object();
    const json* value = member(j, key);
    if (!value)
        return empty;
    if (!value->is_object())
        throw SettingsError(std::string("Setting '") + key + "' must be an object");
    return *value;
}

LogLevel level_from_name(const std::string& name, const std::string& source)
{
    auto level = parse_log_level(name);
    if (!level)
        throw SettingsError("Unknown log level '" + name + "' in " + source);
    return *level;
}

const char* non_empty_env(const char* name)
{
    const char* value = std::getenv(name);
    return value != nullptr && value[0] != '\0' ? value : nullptr;
}

} // namespace

ConsoleSettings ConsoleSettings::from_json(const json& j)
{
    if (!j.is_object())
        throw SettingsError("Settings must be a JSON object");

    ConsoleSettings settings;
    settings.log_level = level_from_name(string_member(j, "logLevel", "info"), "logLevel");
    settings.mode_timeout = std::chrono::seconds(integer_member(j, "modeTimeoutSeconds", 15, 0));

    const json& batch = object_member(j, "batch");
    settings.batch.questions_file = string_member(batch, "questionsFile", settings.batch.questions_file);
    settings.batch.questions_sheet = string_member(batch, "questionsSheet", settings.batch.questions_sheet);
    settings.batch.results_sheet = string_member(batch, "resultsSheet", settings.batch.results_sheet);
    settings.batch.output_prefix = string_member(batch, "outputPrefix", settings.batch.output_prefix);

    const json& bridge = object_member(j, "bridge");
    if (member(bridge, "command"))
        settings.bridge.command = string_member(bridge, "command", "");
    if (member(bridge, "cwd"))
        settings.bridge.cwd = string_member(bridge, "cwd", "");
    settings.bridge.startup_timeout =
        std::chrono::milliseconds(integer_member(bridge, "startupTimeoutMs", 30000, 0));

    try
    {
        if (const json* args = member(bridge, "args"))
            settings.bridge.args = args->get<std::vector<std::string>>();
        if (const json* env = member(bridge, "environment"))
            settings.bridge.environment = env->get<std::map<std::string, std::string>>();
        settings.bridge.connection = object_member(j, "connection").get<ConnectionSettings>();
    }
    catch (const json::exception& e)
    {
        throw SettingsError(std::string("Invalid bridge settings: ") + e.what());
    }

    settings.bridge.log_level = to_string(settings.log_level);
    return settings;
}

ConsoleSettings ConsoleSettings::load(const std::filesystem::path& path, bool required)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
    {
        if (required)
            throw SettingsError("Settings file not found: " + path.string());
        return ConsoleSettings{};
    }

    std::ifstream in(path);
    if (!in)
        throw SettingsError("Cannot open settings file: " + path.string());

    json document = json::parse(in, nullptr, false, true);
    if (document.is_discarded())
        throw SettingsError("Settings file is not valid JSON: " + path.string());
    return from_json(document);
}

void ConsoleSettings::apply_environment()
{
    if (const char* path = non_empty_env(ENV_BRIDGE_PATH))
        bridge.command = path;
    if (const char* level = non_empty_env(ENV_LOG_LEVEL))
    {
        log_level = level_from_name(level, ENV_LOG_LEVEL);
        bridge.log_level = to_string(log_level);
    }
    if (const char* id = non_empty_env(ENV_ENVIRONMENT_ID))
        bridge.connection.environment_id = id;
    if (const char* schema = non_empty_env(ENV_SCHEMA_NAME))
        bridge.connection.schema_name = schema;
}

} // namespace chatconsole
