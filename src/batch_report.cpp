// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <chatconsole/batch_report.hpp>
#include <ctime>
#include <iterator>

namespace chatconsole
{

namespace
{

bool is_continuation_byte(char c)
{
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

/// UTF-16 units taken by the character a lead byte starts
size_t utf16_width(char lead)
{
    return (static_cast<unsigned char>(lead) & 0xF8) == 0xF0 ? 2 : 1;
}

bool is_blank(const std::string& s)
{
    return s.find_first_not_of(" \t\r\n\f\v") == std::string::npos;
}

} // namespace

size_t count_utf16_units(const std::string& text)
{
    size_t count = 0;
    for (char c : text)
        if (!is_continuation_byte(c))
            count += utf16_width(c);
    return count;
}

std::string truncate_cell_text(const std::string& text, size_t max_units)
{
    size_t seen = 0;
    for (size_t i = 0; i < text.size(); ++i)
    {
        if (is_continuation_byte(text[i]))
            continue;
        seen += utf16_width(text[i]);
        if (seen > max_units)
            return text.substr(0, i);
    }
    return text;
}

std::vector<std::string> read_questions(const xlsx::Worksheet& sheet)
{
    std::vector<std::string> questions;
    for (size_t row = 1;; ++row)
    {
        std::string question = sheet.text(row, 1);
        if (is_blank(question))
            break;
        questions.push_back(std::move(question));
    }
    return questions;
}

xlsx::Workbook build_results_workbook(const std::vector<BatchResultRow>& rows, const std::string& sheet_name)
{
    xlsx::Workbook book;
    auto& sheet = book.add_worksheet(sheet_name);

    const char* headers[] = {"Question", "Response", "Conversation id", "Timestamp", "Response Log"};
    for (size_t column = 0; column < std::size(headers); ++column)
        sheet.set(1, column + 1, std::string(headers[column]));

    size_t row = 2;
    for (const auto& result : rows)
    {
        sheet.set(row, 1, truncate_cell_text(result.question));
        sheet.set(row, 2, truncate_cell_text(result.response));
        sheet.set(row, 3, truncate_cell_text(result.conversation_id));
        sheet.set(row, 4, xlsx::DateTime{result.timestamp});
        sheet.set(row, 5, truncate_cell_text(result.response_log));
        ++row;
    }
    return book;
}

std::string make_output_filename(const std::string& prefix, std::chrono::system_clock::time_point now)
{
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&t, &local);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d_%H-%M-%S", &local);
    return prefix + stamp + ".xlsx";
}

} // namespace chatconsole
