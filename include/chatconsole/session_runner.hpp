// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file session_runner.hpp
/// @brief Interactive and batch drivers over an agent client

#include <chatconsole/agent_client.hpp>
#include <chatconsole/batch_report.hpp>
#include <chatconsole/console_input.hpp>
#include <chatconsole/mode_selector.hpp>
#include <filesystem>
#include <ostream>
#include <string>

namespace chatconsole
{

/// Where a batch run reads its questions and writes its results
struct BatchOptions
{
    std::filesystem::path questions_file = "questions.xlsx";
    std::string questions_sheet = "Questions";
    std::string results_sheet = "Results";

    /// Computed once at startup, see make_output_filename()
    std::filesystem::path output_file;
};

/// Outcome of a batch run
struct BatchSummary
{
    /// Questions read from the input sheet
    size_t questions = 0;

    /// Questions that were asked before the run ended
    size_t answered = 0;

    /// Results file, empty when nothing was written
    std::filesystem::path output_file;
};

/// Drives one console session against an agent client
///
/// Example usage:
/// @code
/// ConsoleInput input(std::cin);
/// SessionRunner runner(client, input, std::cout);
/// runner.run(select_mode(input, std::cout, "questions.xlsx"), batch_options, token);
/// @endcode
class SessionRunner
{
  public:
    SessionRunner(IAgentClient& client, ConsoleInput& input, std::ostream& out)
        : client_(client), input_(input), out_(out)
    {
    }

    /// Run the chosen mode
    void run(RunMode mode, const BatchOptions& options, const CancellationToken& token);

    /// Print the greeting, then relay operator lines until cancellation or end of input
    /// @throws std::logic_error if the greeting stream yields an empty turn
    void run_interactive(const CancellationToken& token);

    /// Ask every question of the input sheet and save the results workbook
    ///
    /// Input problems (missing file or sheet, unreadable workbook, no
    /// questions) are reported on the console and end the run without an
    /// exception. Cancellation between questions saves what was collected.
    ///
    /// @throws xlsx::WorkbookError if the results cannot be written
    BatchSummary run_batch(const BatchOptions& options, const CancellationToken& token);

  private:
    IAgentClient& client_;
    ConsoleInput& input_;
    std::ostream& out_;
};

} // namespace chatconsole
