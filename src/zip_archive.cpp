// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <chatconsole/zip_archive.hpp>
#include <limits>
#include <zlib.h>

namespace chatconsole::xlsx
{

namespace
{

constexpr uint32_t kLocalHeaderSignature = 0x04034b50;
constexpr uint32_t kCentralHeaderSignature = 0x02014b50;
constexpr uint32_t kEndOfCentralDirSignature = 0x06054b50;

constexpr size_t kLocalHeaderSize = 30;
constexpr size_t kCentralHeaderSize = 46;
constexpr size_t kEndOfCentralDirSize = 22;

constexpr uint16_t kVersion = 20;
constexpr uint16_t kUtf8NamesFlag = 0x0800;
constexpr uint16_t kMethodStored = 0;
constexpr uint16_t kMethodDeflate = 8;

// 1980-01-01 00:00 in DOS format
constexpr uint16_t kDosTime = 0;
constexpr uint16_t kDosDate = (0 << 9) | (1 << 5) | 1;

// Raw deflate stream (no zlib header)
constexpr int kRawWindowBits = -15;
constexpr size_t kInflateChunk = 64 * 1024;

void put_u16(std::string& out, uint16_t v)
{
    out.push_back(static_cast<char>(v & 0xff));
    out.push_back(static_cast<char>((v >> 8) & 0xff));
}

void put_u32(std::string& out, uint32_t v)
{
    put_u16(out, static_cast<uint16_t>(v & 0xffff));
    put_u16(out, static_cast<uint16_t>(v >> 16));
}

uint16_t get_u16(const std::string& data, size_t pos)
{
    if (pos + 2 > data.size())
        throw WorkbookError("Truncated ZIP archive");
    auto b = reinterpret_cast<const unsigned char*>(data.data() + pos);
    return static_cast<uint16_t>(b[0] | (b[1] << 8));
}

uint32_t get_u32(const std::string& data, size_t pos)
{
    return static_cast<uint32_t>(get_u16(data, pos)) | (static_cast<uint32_t>(get_u16(data, pos + 2)) << 16);
}

uint32_t checksum(const std::string& data)
{
    return static_cast<uint32_t>(
        crc32(crc32(0L, Z_NULL, 0), reinterpret_cast<const Bytef*>(data.data()), static_cast<uInt>(data.size()))
    );
}

std::string deflate_raw(const std::string& input)
{
    z_stream zs{};
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, kRawWindowBits, 8, Z_DEFAULT_STRATEGY) != Z_OK)
        throw WorkbookError("deflateInit2 failed");

    std::string output(deflateBound(&zs, static_cast<uLong>(input.size())), '\0');
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    zs.avail_in = static_cast<uInt>(input.size());
    zs.next_out = reinterpret_cast<Bytef*>(output.data());
    zs.avail_out = static_cast<uInt>(output.size());

    int rc = deflate(&zs, Z_FINISH);
    size_t produced = zs.total_out;
    deflateEnd(&zs);
    if (rc != Z_STREAM_END)
        throw WorkbookError("deflate failed");

    output.resize(produced);
    return output;
}

std::string inflate_raw(const char* input, size_t size, size_t expected_size)
{
    z_stream zs{};
    if (inflateInit2(&zs, kRawWindowBits) != Z_OK)
        throw WorkbookError("inflateInit2 failed");

    // The declared size comes from the archive itself, so the buffer grows
    // with what the stream actually produces instead of being sized up front
    std::string output;
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input));
    zs.avail_in = static_cast<uInt>(size);

    int rc = Z_OK;
    while (rc == Z_OK)
    {
        if (zs.total_out > expected_size)
            break;
        size_t used = zs.total_out;
        output.resize(used + std::min(kInflateChunk, expected_size + 1 - used));
        zs.next_out = reinterpret_cast<Bytef*>(output.data() + used);
        zs.avail_out = static_cast<uInt>(output.size() - used);
        rc = inflate(&zs, Z_NO_FLUSH);
    }

    size_t produced = zs.total_out;
    inflateEnd(&zs);
    if (rc != Z_STREAM_END || produced != expected_size)
        throw WorkbookError("Corrupt deflate stream in ZIP entry");
    output.resize(produced);
    return output;
}

} // namespace

// =============================================================================
// ZipWriter
// =============================================================================

void ZipWriter::add(const std::string& name, const std::string& data)
{
    for (const auto& entry : entries_)
        if (entry.name == name)
            throw WorkbookError("Duplicate ZIP entry: " + name);
    if (data.size() > std::numeric_limits<uint32_t>::max())
        throw WorkbookError("ZIP entry too large: " + name);

    entries_.push_back(Entry{name, checksum(data), static_cast<uint32_t>(data.size()), deflate_raw(data)});
}

std::string ZipWriter::finish() const
{
    std::string out;
    std::vector<uint32_t> offsets;

    for (const auto& e : entries_)
    {
        offsets.push_back(static_cast<uint32_t>(out.size()));
        put_u32(out, kLocalHeaderSignature);
        put_u16(out, kVersion);
        put_u16(out, kUtf8NamesFlag);
        put_u16(out, kMethodDeflate);
        put_u16(out, kDosTime);
        put_u16(out, kDosDate);
        put_u32(out, e.crc);
        put_u32(out, static_cast<uint32_t>(e.compressed.size()));
        put_u32(out, e.uncompressed_size);
        put_u16(out, static_cast<uint16_t>(e.name.size()));
        put_u16(out, 0);
        out += e.name;
        out += e.compressed;
    }

    uint32_t directory_offset = static_cast<uint32_t>(out.size());
    for (size_t i = 0; i < entries_.size(); ++i)
    {
        const auto& e = entries_[i];
        put_u32(out, kCentralHeaderSignature);
        put_u16(out, kVersion);
        put_u16(out, kVersion);
        put_u16(out, kUtf8NamesFlag);
        put_u16(out, kMethodDeflate);
        put_u16(out, kDosTime);
        put_u16(out, kDosDate);
        put_u32(out, e.crc);
        put_u32(out, static_cast<uint32_t>(e.compressed.size()));
        put_u32(out, e.uncompressed_size);
        put_u16(out, static_cast<uint16_t>(e.name.size()));
        put_u16(out, 0); // extra
        put_u16(out, 0); // comment
        put_u16(out, 0); // disk
        put_u16(out, 0); // internal attributes
        put_u32(out, 0); // external attributes
        put_u32(out, offsets[i]);
        out += e.name;
    }
    uint32_t directory_size = static_cast<uint32_t>(out.size()) - directory_offset;

    put_u32(out, kEndOfCentralDirSignature);
    put_u16(out, 0);
    put_u16(out, 0);
    put_u16(out, static_cast<uint16_t>(entries_.size()));
    put_u16(out, static_cast<uint16_t>(entries_.size()));
    put_u32(out, directory_size);
    put_u32(out, directory_offset);
    put_u16(out, 0);
    return out;
}

// =============================================================================
// ZipReader
// =============================================================================

ZipReader::ZipReader(std::string data) : data_(std::move(data))
{
    if (data_.size() < kEndOfCentralDirSize)
        throw WorkbookError("Not a ZIP archive");

    // The end record sits before an optional trailing comment of up to 64 KiB
    size_t eocd = std::string::npos;
    size_t lowest = data_.size() > kEndOfCentralDirSize + 0xffff ? data_.size() - kEndOfCentralDirSize - 0xffff : 0;
    for (size_t pos = data_.size() - kEndOfCentralDirSize + 1; pos-- > lowest;)
    {
        if (get_u32(data_, pos) == kEndOfCentralDirSignature)
        {
            eocd = pos;
            break;
        }
    }
    if (eocd == std::string::npos)
        throw WorkbookError("Not a ZIP archive (no end of central directory)");

    uint16_t count = get_u16(data_, eocd + 10);
    uint32_t directory_offset = get_u32(data_, eocd + 16);
    if (count == 0xffff || directory_offset == 0xffffffff)
        throw WorkbookError("ZIP64 archives are not supported");

    size_t pos = directory_offset;
    for (uint16_t i = 0; i < count; ++i)
    {
        if (get_u32(data_, pos) != kCentralHeaderSignature)
            throw WorkbookError("Corrupt ZIP central directory");

        Entry entry;
        entry.method = get_u16(data_, pos + 10);
        entry.crc = get_u32(data_, pos + 16);
        entry.compressed_size = get_u32(data_, pos + 20);
        entry.uncompressed_size = get_u32(data_, pos + 24);
        uint16_t name_len = get_u16(data_, pos + 28);
        uint16_t extra_len = get_u16(data_, pos + 30);
        uint16_t comment_len = get_u16(data_, pos + 32);
        entry.local_header_offset = get_u32(data_, pos + 42);

        if (pos + kCentralHeaderSize + name_len > data_.size())
            throw WorkbookError("Truncated ZIP central directory");
        std::string name = data_.substr(pos + kCentralHeaderSize, name_len);

        if (entries_.emplace(name, entry).second)
            order_.push_back(name);
        pos += kCentralHeaderSize + name_len + extra_len + comment_len;
    }
}

bool ZipReader::contains(const std::string& name) const
{
    return entries_.count(name) != 0;
}

std::vector<std::string> ZipReader::names() const
{
    return order_;
}

std::string ZipReader::read(const std::string& name) const
{
    auto it = entries_.find(name);
    if (it == entries_.end())
        throw WorkbookError("Missing ZIP entry: " + name);
    const Entry& e = it->second;

    size_t header = e.local_header_offset;
    if (get_u32(data_, header) != kLocalHeaderSignature)
        throw WorkbookError("Corrupt ZIP local header: " + name);
    size_t start = header + kLocalHeaderSize + get_u16(data_, header + 26) + get_u16(data_, header + 28);
    if (start + e.compressed_size > data_.size())
        throw WorkbookError("Truncated ZIP entry: " + name);

    std::string content;
    if (e.method == kMethodStored)
        content = data_.substr(start, e.compressed_size);
    else if (e.method == kMethodDeflate)
        content = inflate_raw(data_.data() + start, e.compressed_size, e.uncompressed_size);
    else
        throw WorkbookError("Unsupported ZIP compression method " + std::to_string(e.method) + ": " + name);

    if (checksum(content) != e.crc)
        throw WorkbookError("CRC mismatch in ZIP entry: " + name);
    return content;
}

} // namespace chatconsole::xlsx
