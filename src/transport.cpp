// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <cctype>
#include <cerrno>
#include <chatconsole/process.hpp>
#include <chatconsole/transport.hpp>
#include <cstring>
#include <optional>
#include <unistd.h>

namespace chatconsole
{

namespace
{

constexpr size_t kReadChunk = 4096;
constexpr const char* kContentLength = "content-length:";

std::string to_lower(std::string s)
{
    for (auto& c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

} // namespace

// =============================================================================
// MessageFramer
// =============================================================================

bool MessageFramer::fill()
{
    char chunk[kReadChunk];
    size_t n = transport_.read(chunk, sizeof(chunk));
    if (n == 0)
        return false;
    buffer_.append(chunk, n);
    return true;
}

std::string MessageFramer::read_message()
{
    // Headers end at the first blank line; accept bare \n line endings too
    size_t header_end = std::string::npos;
    size_t separator_len = 0;
    while (true)
    {
        size_t crlf = buffer_.find("\r\n\r\n");
        size_t lf = buffer_.find("\n\n");
        if (crlf != std::string::npos && (lf == std::string::npos || crlf <= lf))
        {
            header_end = crlf;
            separator_len = 4;
            break;
        }
        if (lf != std::string::npos)
        {
            header_end = lf;
            separator_len = 2;
            break;
        }
        if (!fill())
            throw ConnectionClosedError("Connection closed while reading header");
    }

    std::optional<size_t> content_length;
    size_t pos = 0;
    while (pos < header_end)
    {
        size_t eol = buffer_.find('\n', pos);
        if (eol == std::string::npos || eol > header_end)
            eol = header_end;
        std::string line = buffer_.substr(pos, eol - pos);
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        pos = eol + 1;

        if (to_lower(line).compare(0, std::strlen(kContentLength), kContentLength) != 0)
            continue;

        std::string value = line.substr(std::strlen(kContentLength));
        size_t start = value.find_first_not_of(" \t");
        value = start == std::string::npos ? std::string{} : value.substr(start);
        try
        {
            content_length = std::stoull(value);
        }
        catch (const std::exception&)
        {
            throw TransportError("Invalid Content-Length value: " + value);
        }
    }

    if (!content_length)
        throw TransportError("Missing Content-Length header");

    size_t body_start = header_end + separator_len;
    while (buffer_.size() < body_start + *content_length)
        if (!fill())
            throw ConnectionClosedError("Connection closed while reading message body");

    std::string message = buffer_.substr(body_start, *content_length);
    buffer_.erase(0, body_start + *content_length);
    return message;
}

void MessageFramer::write_message(const std::string& message)
{
    transport_.write("Content-Length: " + std::to_string(message.size()) + "\r\n\r\n" + message);
}

// =============================================================================
// FdTransport
// =============================================================================

size_t FdTransport::read(char* buffer, size_t size)
{
    if (!open_)
        throw ConnectionClosedError();

    while (true)
    {
        ssize_t bytes_read = ::read(read_fd_, buffer, size);
        if (bytes_read > 0)
            return static_cast<size_t>(bytes_read);
        if (bytes_read == 0 || errno == EBADF)
        {
            open_ = false;
            return 0;
        }
        if (errno != EINTR)
            throw TransportError("read() failed: " + std::string(std::strerror(errno)));
    }
}

void FdTransport::write(const char* data, size_t size)
{
    if (!open_)
        throw ConnectionClosedError();

    size_t total_written = 0;
    while (total_written < size)
    {
        ssize_t bytes_written = ::write(write_fd_, data + total_written, size - total_written);
        if (bytes_written < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EPIPE)
            {
                open_ = false;
                throw ConnectionClosedError("Peer closed the connection");
            }
            throw TransportError("write() failed: " + std::string(std::strerror(errno)));
        }
        total_written += static_cast<size_t>(bytes_written);
    }
}

void FdTransport::close()
{
    if (!open_.exchange(false))
        return;

    if (owns_fds_)
    {
        if (read_fd_ >= 0)
            ::close(read_fd_);
        if (write_fd_ >= 0 && write_fd_ != read_fd_)
            ::close(write_fd_);
    }
    read_fd_ = -1;
    write_fd_ = -1;
}

// =============================================================================
// PipeTransport
// =============================================================================

size_t PipeTransport::read(char* buffer, size_t size)
{
    if (!open_)
        throw ConnectionClosedError();
    try
    {
        size_t n = read_pipe_->read(buffer, size);
        if (n == 0)
            open_ = false;
        return n;
    }
    catch (const ProcessError& e)
    {
        open_ = false;
        throw TransportError(e.what());
    }
}

void PipeTransport::write(const char* data, size_t size)
{
    if (!open_)
        throw ConnectionClosedError();
    try
    {
        write_pipe_->write(data, size);
    }
    catch (const ProcessError& e)
    {
        open_ = false;
        throw ConnectionClosedError(e.what());
    }
}

void PipeTransport::close()
{
    open_ = false;
}

} // namespace chatconsole
