// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <chatconsole/logging.hpp>
#include <chatconsole/mode_selector.hpp>

namespace chatconsole
{

namespace
{

std::string trim(const std::string& s)
{
    const char* ws = " \t\r\n\f\v";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos)
        return {};
    return s.substr(start, s.find_last_not_of(ws) - start + 1);
}

} // namespace

RunMode select_mode(
    ConsoleInput& input,
    std::ostream& out,
    const std::string& questions_file,
    std::chrono::milliseconds timeout
)
{
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(timeout).count();

    out << "\nChoose an option:\n";
    out << "1. Ask your own questions\n";
    out << "2. Run batch from " << questions_file << "\n";
    out << "\nEnter your choice (defaulting to batch in " << seconds << " seconds): " << std::flush;

    auto choice = input.read_line_for(timeout);
    if (!choice)
    {
        CHATCONSOLE_LOG_DEBUG("No mode chosen in time, defaulting to batch");
        return RunMode::Batch;
    }
    return trim(*choice) == "1" ? RunMode::Interactive : RunMode::Batch;
}

} // namespace chatconsole
