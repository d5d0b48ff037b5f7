// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <chatconsole/logging.hpp>
#include <chatconsole/reply_printer.hpp>
#include <chatconsole/session_runner.hpp>
#include <stdexcept>
#include <system_error>

namespace chatconsole
{

void SessionRunner::run(RunMode mode, const BatchOptions& options, const CancellationToken& token)
{
    if (mode == RunMode::Batch)
    {
        out_ << "\nRunning batch mode...\n";
        run_batch(options, token);
    }
    else
    {
        out_ << "\nRunning interactive mode...\n";
        run_interactive(token);
    }
}

// =============================================================================
// Interactive
// =============================================================================

void SessionRunner::run_interactive(const CancellationToken& token)
{
    auto greeting = client_.start_conversation(true, token);
    while (greeting.next())
    {
        const auto& activity = greeting.current();
        if (!activity)
            throw std::logic_error("Activity is null");
        out_ << "\nAgent> " << activity->text.value_or("") << "\n";
    }

    ReplyPrinter printer(client_, input_, out_);
    while (!token.is_cancellation_requested())
    {
        out_ << "\nUser> " << std::flush;
        auto question = input_.read_line(token);
        if (!question)
            break;

        out_ << "\nAgent>\n";
        printer.print(client_.ask_question(*question, std::nullopt, token), token);
    }

    if (!token.is_cancellation_requested())
        CHATCONSOLE_LOG_DEBUG("Console input ended, leaving interactive mode");
}

// =============================================================================
// Batch
// =============================================================================

BatchSummary SessionRunner::run_batch(const BatchOptions& options, const CancellationToken& token)
{
    BatchSummary summary;
    const std::string input_name = options.questions_file.string();

    std::error_code ec;
    if (!std::filesystem::exists(options.questions_file, ec))
    {
        out_ << "Error: " << input_name << " not found.\n";
        return summary;
    }

    std::vector<std::string> questions;
    try
    {
        auto book = xlsx::Workbook::load(options.questions_file);
        const auto* sheet = book.find_worksheet(options.questions_sheet);
        if (!sheet)
        {
            out_ << "Error: worksheet '" << options.questions_sheet << "' not found in " << input_name << ".\n";
            return summary;
        }
        questions = read_questions(*sheet);
    }
    catch (const xlsx::WorkbookError& e)
    {
        out_ << "Error: cannot read " << input_name << ": " << e.what() << "\n";
        return summary;
    }

    summary.questions = questions.size();
    if (questions.empty())
    {
        out_ << "No questions found in the Excel file.\n";
        return summary;
    }

    std::vector<BatchResultRow> rows;

    // Only the opening turn is recorded; the rest of the start stream is dropped
    {
        BatchResultRow start{kSystemStartLabel, "", "", std::chrono::system_clock::now(), ""};
        auto greeting = client_.start_conversation(true, token);
        if (greeting.next() && greeting.current())
        {
            const Activity& activity = *greeting.current();
            out_ << "Agent> " << activity.text.value_or("") << "\n";
            start.response = activity.text.value_or("");
            start.conversation_id = activity.conversation_id();
            start.response_log = format_activity_log(activity);
        }
        rows.push_back(std::move(start));
    }

    for (size_t i = 0; i < questions.size(); ++i)
    {
        if (token.is_cancellation_requested())
        {
            out_ << "\nBatch cancelled after " << i << " of " << questions.size() << " questions.\n";
            break;
        }

        const std::string& question = questions[i];
        out_ << "\nAsking question " << (i + 1) << " of " << questions.size() << "\n";
        out_ << "User> " << question << "\n";

        BatchResultRow row{question, "", "", {}, ""};
        auto reply = client_.ask_question(question, std::nullopt, token);
        while (reply.next())
        {
            const auto& activity = reply.current();
            if (!activity)
            {
                CHATCONSOLE_LOG_WARN("Skipping empty reply turn");
                continue;
            }
            if (activity->has_text())
            {
                out_ << "Agent> " << *activity->text << "\n";
                row.response += *activity->text + "\n";
            }
            row.response_log += format_activity_log(*activity) + "\n";
            if (row.conversation_id.empty())
                row.conversation_id = activity->conversation_id();
        }
        row.timestamp = std::chrono::system_clock::now();

        if (count_utf16_units(row.response) > kMaxCellCharacters ||
            count_utf16_units(row.response_log) > kMaxCellCharacters)
            CHATCONSOLE_LOG_INFO("Truncating oversized result for question " + std::to_string(i + 1));

        rows.push_back(std::move(row));
        ++summary.answered;
    }

    build_results_workbook(rows, options.results_sheet).save_as(options.output_file);
    summary.output_file = options.output_file;
    out_ << "\nResults saved to " << options.output_file.string() << "\n";
    return summary;
}

} // namespace chatconsole
