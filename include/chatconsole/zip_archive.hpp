// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file zip_archive.hpp
/// @brief In-memory ZIP container used by the workbook reader and writer

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace chatconsole::xlsx
{

/// Exception thrown for unreadable, corrupt or unsupported workbook files
class WorkbookError : public std::runtime_error
{
  public:
    explicit WorkbookError(const std::string& message) : std::runtime_error(message) {}
};

/// Builds a ZIP archive; entries are deflated in insertion order
class ZipWriter
{
  public:
    /// Add an entry
    /// @throws WorkbookError if the name is already present or compression fails
    void add(const std::string& name, const std::string& data);

    /// Finish the archive and return its bytes
    std::string finish() const;

  private:
    struct Entry
    {
        std::string name;
        uint32_t crc = 0;
        uint32_t uncompressed_size = 0;
        std::string compressed;
    };

    std::vector<Entry> entries_;
};

/// Reads entries of a ZIP archive held in memory
///
/// Supports stored and deflated entries. ZIP64 archives are rejected.
class ZipReader
{
  public:
    /// @throws WorkbookError if the central directory cannot be parsed
    explicit ZipReader(std::string data);

    bool contains(const std::string& name) const;

    /// Entry names in central directory order
    std::vector<std::string> names() const;

    /// Decompress an entry and verify its checksum
    /// @throws WorkbookError if the entry is missing or corrupt
    std::string read(const std::string& name) const;

  private:
    struct Entry
    {
        uint16_t method = 0;
        uint32_t crc = 0;
        uint32_t compressed_size = 0;
        uint32_t uncompressed_size = 0;
        uint32_t local_header_offset = 0;
    };

    std::string data_;
    std::vector<std::string> order_;
    std::map<std::string, Entry> entries_;
};

} // namespace chatconsole::xlsx
