// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file mode_selector.hpp
/// @brief Interactive/batch choice with a default after a timeout

#include <chatconsole/console_input.hpp>
#include <chrono>
#include <ostream>
#include <string>

namespace chatconsole
{

enum class RunMode
{
    Interactive,
    Batch
};

/// Default wait for the operator's choice
inline constexpr std::chrono::seconds kDefaultModeTimeout{15};

/// Print the mode menu and read the operator's choice
///
/// Only a trimmed "1" selects interactive mode. Timeout, end of input and any
/// other answer select batch mode.
RunMode select_mode(
    ConsoleInput& input,
    std::ostream& out,
    const std::string& questions_file,
    std::chrono::milliseconds timeout = kDefaultModeTimeout
);

} // namespace chatconsole
