// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file workbook.hpp
/// @brief Minimal Office Open XML (.xlsx) workbook model with reader and writer

#include <chatconsole/zip_archive.hpp>
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace chatconsole::xlsx
{

/// A point in time, written as a local-time Excel date cell
struct DateTime
{
    std::chrono::system_clock::time_point time;
};

/// Cell contents; std::monostate means empty
using CellValue = std::variant<std::monostate, std::string, double, DateTime>;

/// Convert a time point to an Excel serial date (days since 1899-12-30, local time)
double to_excel_serial(std::chrono::system_clock::time_point time);

/// A named grid of cells addressed by 1-based row and column
class Worksheet
{
  public:
    explicit Worksheet(std::string name) : name_(std::move(name)) {}

    const std::string& name() const
    {
        return name_;
    }

    /// Set a cell; assigning std::monostate clears it
    void set(size_t row, size_t column, CellValue value);

    /// @return The cell value, or std::monostate for an empty cell
    const CellValue& get(size_t row, size_t column) const;

    /// Cell contents as text: strings verbatim, numbers in shortest general
    /// form, dates as `yyyy-MM-dd HH:mm:ss`, empty cells as ""
    std::string text(size_t row, size_t column) const;

    /// Highest row holding a cell (0 when the sheet is empty)
    size_t max_row() const;

    /// Rows in ascending order, each mapping column to value
    const std::map<size_t, std::map<size_t, CellValue>>& rows() const
    {
        return rows_;
    }

  private:
    std::string name_;
    std::map<size_t, std::map<size_t, CellValue>> rows_;
};

/// Ordered collection of worksheets
///
/// Example usage:
/// @code
/// xlsx::Workbook book;
/// auto& sheet = book.add_worksheet("Results");
/// sheet.set(1, 1, std::string("Question"));
/// book.save_as("out.xlsx");
///
/// auto loaded = xlsx::Workbook::load("out.xlsx");
/// std::string header = loaded.worksheet("Results").text(1, 1);
/// @endcode
class Workbook
{
  public:
    Workbook() = default;
    Workbook(Workbook&&) noexcept = default;
    Workbook& operator=(Workbook&&) noexcept = default;

    /// @throws WorkbookError if the name is empty, too long or already used
    Worksheet& add_worksheet(const std::string& name);

    /// @return The sheet, or nullptr if there is none by that name
    const Worksheet* find_worksheet(const std::string& name) const;

    /// @throws WorkbookError if there is no sheet by that name
    const Worksheet& worksheet(const std::string& name) const;

    size_t worksheet_count() const
    {
        return sheets_.size();
    }

    /// Serialize to .xlsx bytes
    std::string to_bytes() const;

    /// Write the workbook to a file
    /// @throws WorkbookError on serialization or I/O failure
    void save_as(const std::filesystem::path& path) const;

    /// Parse .xlsx bytes
    /// @throws WorkbookError if the data is not a readable workbook
    static Workbook from_bytes(std::string data);

    /// Read a workbook file
    /// @throws WorkbookError if the file is missing or not a readable workbook
    static Workbook load(const std::filesystem::path& path);

  private:
    std::vector<std::unique_ptr<Worksheet>> sheets_;
};

} // namespace chatconsole::xlsx
