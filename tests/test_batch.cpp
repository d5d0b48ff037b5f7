// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include "fake_agent_client.hpp"

#include <chatconsole/batch_report.hpp>
#include <chatconsole/session_runner.hpp>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>

using namespace chatconsole;

// =============================================================================
// Cell Text Limits
// =============================================================================

TEST(BatchReportTest, ShortTextIsUnchanged)
{
    EXPECT_EQ(truncate_cell_text(""), "");
    EXPECT_EQ(truncate_cell_text("short"), "short");

    std::string at_limit(kMaxCellCharacters, 'a');
    EXPECT_EQ(truncate_cell_text(at_limit), at_limit);
}

TEST(BatchReportTest, LongTextIsCutToTheLimit)
{
    std::string long_text(kMaxCellCharacters + 500, 'a');
    std::string cut = truncate_cell_text(long_text);

    EXPECT_EQ(cut.size(), kMaxCellCharacters);
    EXPECT_EQ(count_utf16_units(cut), 32767u);
}

TEST(BatchReportTest, MultiByteCharactersAreNeverSplit)
{
    // Each euro sign is three bytes
    std::string euros;
    for (int i = 0; i < 10; ++i)
        euros += "\xE2\x82\xAC";

    std::string cut = truncate_cell_text(euros, 4);
    EXPECT_EQ(cut, "\xE2\x82\xAC\xE2\x82\xAC\xE2\x82\xAC\xE2\x82\xAC");
    EXPECT_EQ(count_utf16_units(cut), 4u);

    EXPECT_EQ(truncate_cell_text("a\xC3\xA9z", 2), "a\xC3\xA9");
    EXPECT_EQ(truncate_cell_text(euros, 10), euros);
}

TEST(BatchReportTest, CountsUtf16Units)
{
    EXPECT_EQ(count_utf16_units(""), 0u);
    EXPECT_EQ(count_utf16_units("abc"), 3u);
    EXPECT_EQ(count_utf16_units("caf\xC3\xA9"), 4u);
    EXPECT_EQ(count_utf16_units("\xE2\x82\xAC"), 1u);
    EXPECT_EQ(count_utf16_units("\xF0\x9F\x98\x80"), 2u);
}

TEST(BatchReportTest, AstralCharactersCountTwice)
{
    const std::string grin = "\xF0\x9F\x98\x80";
    std::string emoji;
    for (int i = 0; i < 40000; ++i)
        emoji += grin;

    std::string cut = truncate_cell_text(emoji);
    EXPECT_LE(count_utf16_units(cut), kMaxCellCharacters);
    // 32767 is odd, so the last emoji would straddle the limit
    EXPECT_EQ(cut.size(), 16383u * grin.size());

    EXPECT_EQ(truncate_cell_text("a" + grin + "b", 2), "a");
    EXPECT_EQ(truncate_cell_text("a" + grin + "b", 3), "a" + grin);
}

// =============================================================================
// Questions and Results Layout
// =============================================================================

TEST(BatchReportTest, ReadsColumnAUntilFirstBlank)
{
    xlsx::Worksheet sheet("Questions");
    sheet.set(1, 1, std::string("First?"));
    sheet.set(2, 1, 42.0);
    sheet.set(2, 2, std::string("ignored column"));
    sheet.set(3, 1, std::string("Third?"));
    sheet.set(4, 1, std::string("   "));
    sheet.set(5, 1, std::string("after the gap"));

    EXPECT_EQ(read_questions(sheet), (std::vector<std::string>{"First?", "42", "Third?"}));
}

TEST(BatchReportTest, EmptySheetHasNoQuestions)
{
    xlsx::Worksheet sheet("Questions");
    sheet.set(1, 2, std::string("not in column A"));
    EXPECT_TRUE(read_questions(sheet).empty());
}

TEST(BatchReportTest, ResultsLayout)
{
    auto when = std::chrono::system_clock::now();
    std::vector<BatchResultRow> rows{
        {kSystemStartLabel, "Hello!", "conv-1", when, "{}"},
        {"Q?", std::string(kMaxCellCharacters + 10, 'r'), "conv-1", when, "log"},
    };

    auto book = build_results_workbook(rows, "Results");
    const auto& sheet = book.worksheet("Results");

    EXPECT_EQ(sheet.text(1, 1), "Question");
    EXPECT_EQ(sheet.text(1, 2), "Response");
    EXPECT_EQ(sheet.text(1, 3), "Conversation id");
    EXPECT_EQ(sheet.text(1, 4), "Timestamp");
    EXPECT_EQ(sheet.text(1, 5), "Response Log");

    EXPECT_EQ(sheet.text(2, 1), "System Start");
    EXPECT_EQ(sheet.text(2, 2), "Hello!");
    EXPECT_TRUE(std::holds_alternative<xlsx::DateTime>(sheet.get(2, 4)));
    EXPECT_EQ(sheet.text(3, 2).size(), kMaxCellCharacters);
    EXPECT_EQ(sheet.max_row(), 3u);
}

TEST(BatchReportTest, OutputFileNameUsesLocalTime)
{
    std::tm local{};
    local.tm_year = 2025 - 1900;
    local.tm_mon = 2;
    local.tm_mday = 4;
    local.tm_hour = 5;
    local.tm_min = 6;
    local.tm_sec = 7;
    local.tm_isdst = -1;
    auto when = std::chrono::system_clock::from_time_t(std::mktime(&local));

    EXPECT_EQ(make_output_filename("Response_", when), "Response_2025-03-04_05-06-07.xlsx");
    EXPECT_EQ(make_output_filename("", when), "2025-03-04_05-06-07.xlsx");
}

// =============================================================================
// Batch Runs
// =============================================================================

namespace
{

class BatchRunTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        dir_ = std::filesystem::temp_directory_path() /
               ("chatconsole_batch_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::create_directories(dir_);

        options_.questions_file = dir_ / "questions.xlsx";
        options_.output_file = dir_ / "Response_test.xlsx";

        client_.greeting = {message("Hello! How can I help?", "conv-1")};
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    void write_questions(const std::vector<std::string>& questions, const std::string& sheet_name = "Questions")
    {
        xlsx::Workbook book;
        auto& sheet = book.add_worksheet(sheet_name);
        for (size_t i = 0; i < questions.size(); ++i)
            sheet.set(i + 1, 1, questions[i]);
        book.save_as(options_.questions_file);
    }

    BatchSummary run(const CancellationToken& token = {})
    {
        std::istringstream in;
        ConsoleInput input(in);
        SessionRunner runner(client_, input, out_);
        return runner.run_batch(options_, token);
    }

    xlsx::Workbook results() const
    {
        return xlsx::Workbook::load(options_.output_file);
    }

    std::filesystem::path dir_;
    BatchOptions options_;
    FakeAgentClient client_;
    std::ostringstream out_;
};

} // namespace

TEST_F(BatchRunTest, SingleQuestion)
{
    write_questions({"Hello"});
    client_.replies.push_back({turn({{"type", "typing"}}), turn({{"type", "message"}, {"text", "Hi there"}})});

    auto summary = run();

    EXPECT_EQ(summary.questions, 1u);
    EXPECT_EQ(summary.answered, 1u);
    EXPECT_EQ(summary.output_file, options_.output_file);
    EXPECT_EQ(client_.start_calls, std::vector<bool>{true});
    EXPECT_EQ(client_.questions, std::vector<std::string>{"Hello"});

    EXPECT_EQ(
        out_.str(),
        "Agent> Hello! How can I help?\n"
        "\nAsking question 1 of 1\n"
        "User> Hello\n"
        "Agent> Hi there\n"
        "\nResults saved to " +
            options_.output_file.string() + "\n"
    );

    auto book = results();
    const auto& sheet = book.worksheet("Results");
    EXPECT_EQ(sheet.text(1, 1), "Question");
    EXPECT_EQ(sheet.text(1, 5), "Response Log");

    EXPECT_EQ(sheet.text(2, 1), "System Start");
    EXPECT_EQ(sheet.text(2, 2), "Hello! How can I help?");
    EXPECT_EQ(sheet.text(2, 3), "conv-1");
    EXPECT_TRUE(std::holds_alternative<double>(sheet.get(2, 4)));
    EXPECT_EQ(json::parse(sheet.text(2, 5))["text"], "Hello! How can I help?");

    EXPECT_EQ(sheet.text(3, 1), "Hello");
    EXPECT_EQ(sheet.text(3, 2), "Hi there\n");
    EXPECT_EQ(sheet.text(3, 3), "");
    EXPECT_TRUE(std::holds_alternative<double>(sheet.get(3, 4)));
    EXPECT_NE(sheet.text(3, 5).find("\"typing\""), std::string::npos);
    EXPECT_NE(sheet.text(3, 5).find("\"Hi there\""), std::string::npos);
    EXPECT_EQ(sheet.max_row(), 3u);
}

TEST_F(BatchRunTest, EveryQuestionGetsARow)
{
    write_questions({"One?", "Two?", "Three?"});
    client_.replies.push_back({message("First answer", "conv-9")});
    client_.replies.push_back({message("Part A", "conv-9"), message("Part B", "conv-9")});
    client_.replies.push_back({});

    auto summary = run();

    EXPECT_EQ(summary.answered, 3u);
    EXPECT_EQ(client_.questions, (std::vector<std::string>{"One?", "Two?", "Three?"}));

    auto book = results();
    const auto& sheet = book.worksheet("Results");
    EXPECT_EQ(sheet.max_row(), 5u);
    EXPECT_EQ(sheet.text(3, 2), "First answer\n");
    EXPECT_EQ(sheet.text(3, 3), "conv-9");
    EXPECT_EQ(sheet.text(4, 2), "Part A\nPart B\n");
    EXPECT_EQ(sheet.text(5, 1), "Three?");
    EXPECT_EQ(sheet.text(5, 2), "");
    EXPECT_EQ(sheet.text(5, 5), "");
}

TEST_F(BatchRunTest, FirstConversationIdWins)
{
    write_questions({"Q"});
    client_.replies.push_back(
        {turn({{"type", "typing"}}), message("a", "conv-first"), message("b", "conv-second")}
    );

    run();
    EXPECT_EQ(results().worksheet("Results").text(3, 3), "conv-first");
}

TEST_F(BatchRunTest, NullTurnsAreSkipped)
{
    write_questions({"Q"});
    client_.replies.push_back({nullptr, message("still here")});

    run();
    EXPECT_EQ(results().worksheet("Results").text(3, 2), "still here\n");
}

TEST_F(BatchRunTest, OversizedResponseIsTruncated)
{
    write_questions({"Tell me everything"});
    client_.replies.push_back({message(std::string(40000, 'x'))});

    run();
    auto book = results();
    EXPECT_EQ(book.worksheet("Results").text(3, 2).size(), kMaxCellCharacters);
    EXPECT_EQ(count_utf16_units(book.worksheet("Results").text(3, 5)), kMaxCellCharacters);
}

TEST_F(BatchRunTest, SystemStartRowWithoutGreeting)
{
    write_questions({"Q"});
    client_.greeting.clear();
    client_.replies.push_back({message("A")});

    run();
    auto book = results();
    const auto& sheet = book.worksheet("Results");
    EXPECT_EQ(sheet.text(2, 1), "System Start");
    EXPECT_EQ(sheet.text(2, 2), "");
    EXPECT_TRUE(std::holds_alternative<double>(sheet.get(2, 4)));
    EXPECT_EQ(out_.str().find("Agent> \n"), std::string::npos);
}

TEST_F(BatchRunTest, OnlyTheFirstGreetingTurnIsRecorded)
{
    write_questions({"Q"});
    client_.greeting = {message("Welcome"), message("Second greeting")};
    client_.replies.push_back({message("A")});

    run();
    EXPECT_EQ(results().worksheet("Results").text(2, 2), "Welcome");
    EXPECT_EQ(out_.str().find("Second greeting"), std::string::npos);
}

TEST_F(BatchRunTest, CancellationSavesWhatWasCollected)
{
    write_questions({"One?", "Two?", "Three?"});
    client_.replies.push_back({message("First answer")});

    CancellationSource source;
    client_.on_ask = [&source](const std::string& question)
    {
        if (question == "Two?")
            source.cancel();
    };

    auto summary = run(source.token());

    EXPECT_EQ(summary.questions, 3u);
    EXPECT_EQ(summary.answered, 2u);
    EXPECT_EQ(client_.questions, (std::vector<std::string>{"One?", "Two?"}));
    EXPECT_NE(out_.str().find("\nBatch cancelled after 2 of 3 questions.\n"), std::string::npos);

    auto book = results();
    const auto& sheet = book.worksheet("Results");
    EXPECT_EQ(sheet.max_row(), 4u);
    EXPECT_EQ(sheet.text(3, 2), "First answer\n");
    EXPECT_EQ(sheet.text(4, 1), "Two?");
}

TEST_F(BatchRunTest, MissingQuestionsFile)
{
    auto summary = run();

    EXPECT_EQ(out_.str(), "Error: " + options_.questions_file.string() + " not found.\n");
    EXPECT_EQ(summary.questions, 0u);
    EXPECT_TRUE(summary.output_file.empty());
    EXPECT_TRUE(client_.start_calls.empty());
    EXPECT_FALSE(std::filesystem::exists(options_.output_file));
}

TEST_F(BatchRunTest, MissingQuestionsSheet)
{
    write_questions({"Q"}, "Sheet1");
    run();

    EXPECT_EQ(
        out_.str(), "Error: worksheet 'Questions' not found in " + options_.questions_file.string() + ".\n"
    );
    EXPECT_TRUE(client_.start_calls.empty());
    EXPECT_FALSE(std::filesystem::exists(options_.output_file));
}

TEST_F(BatchRunTest, UnreadableQuestionsFile)
{
    std::ofstream(options_.questions_file) << "this is not a spreadsheet";
    run();

    EXPECT_EQ(out_.str().rfind("Error: cannot read " + options_.questions_file.string() + ": ", 0), 0u);
    EXPECT_TRUE(client_.start_calls.empty());
}

TEST_F(BatchRunTest, NoQuestions)
{
    write_questions({});
    auto summary = run();

    EXPECT_EQ(out_.str(), "No questions found in the Excel file.\n");
    EXPECT_EQ(summary.questions, 0u);
    EXPECT_TRUE(client_.start_calls.empty());
    EXPECT_FALSE(std::filesystem::exists(options_.output_file));
}

TEST_F(BatchRunTest, RunPrintsModeBanner)
{
    write_questions({"Q"});
    client_.replies.push_back({message("A")});

    std::istringstream in;
    ConsoleInput input(in);
    SessionRunner runner(client_, input, out_);
    runner.run(RunMode::Batch, options_, CancellationToken{});

    EXPECT_EQ(out_.str().rfind("\nRunning batch mode...\n", 0), 0u);
    EXPECT_TRUE(std::filesystem::exists(options_.output_file));
}
