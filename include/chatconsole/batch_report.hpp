// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file batch_report.hpp
/// @brief Batch question input and result workbook layout

#include <chatconsole/workbook.hpp>
#include <chrono>
#include <string>
#include <vector>

namespace chatconsole
{

/// Most characters a spreadsheet cell can hold, in UTF-16 code units
inline constexpr size_t kMaxCellCharacters = 32767;

/// Cut UTF-8 text so it fits in `max_units` UTF-16 code units
///
/// Text at or under the limit is returned unchanged. A multi-byte sequence is
/// never split, and a character outside the BMP (two units) that would
/// straddle the limit is left out whole.
std::string truncate_cell_text(const std::string& text, size_t max_units = kMaxCellCharacters);

/// Length of UTF-8 text in UTF-16 code units (4-byte sequences count twice)
size_t count_utf16_units(const std::string& text);

/// One row of the results sheet
struct BatchResultRow
{
    std::string question;
    std::string response;
    std::string conversation_id;
    std::chrono::system_clock::time_point timestamp;
    std::string response_log;
};

/// Question label of the synthetic greeting row
inline constexpr const char* kSystemStartLabel = "System Start";

/// Column A, rows 1..N, up to the first blank or whitespace-only cell
std::vector<std::string> read_questions(const xlsx::Worksheet& sheet);

/// Build the results workbook: a header row, then one row per result with
/// text fields truncated to the cell limit
xlsx::Workbook build_results_workbook(const std::vector<BatchResultRow>& rows, const std::string& sheet_name);

/// `<prefix><yyyy-MM-dd_HH-mm-ss>.xlsx` in local time
std::string make_output_filename(const std::string& prefix, std::chrono::system_clock::time_point now);

} // namespace chatconsole
