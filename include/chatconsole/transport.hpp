// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file transport.hpp
/// @brief Byte transports and Content-Length message framing for the bridge protocol

#include <atomic>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace chatconsole
{

class ReadPipe;
class WritePipe;

// =============================================================================
// Transport Exceptions
// =============================================================================

/// Exception thrown when transport operations fail
class TransportError : public std::runtime_error
{
  public:
    explicit TransportError(const std::string& message) : std::runtime_error(message) {}
};

/// Exception thrown when the peer has closed the connection
class ConnectionClosedError : public TransportError
{
  public:
    ConnectionClosedError() : TransportError("Connection closed") {}
    explicit ConnectionClosedError(const std::string& message) : TransportError(message) {}
};

// =============================================================================
// Transport Interface
// =============================================================================

/// Raw byte stream underneath the JSON-RPC client
class ITransport
{
  public:
    virtual ~ITransport() = default;

    /// Read up to `size` bytes
    /// @return Number of bytes read (0 indicates EOF)
    /// @throws TransportError on read failure
    virtual size_t read(char* buffer, size_t size) = 0;

    /// Write all bytes
    /// @throws TransportError on write failure
    virtual void write(const char* data, size_t size) = 0;

    virtual void close() = 0;

    virtual bool is_open() const = 0;

    void write(const std::string& data)
    {
        write(data.data(), data.size());
    }
};

// =============================================================================
// Content-Length Message Framer (LSP-style)
// =============================================================================

/// Splits a byte stream into `Content-Length` framed messages
///
/// Message format:
/// ```
/// Content-Length: <length>\r\n
/// \r\n
/// <json-rpc-message>
/// ```
/// Header names are case-insensitive; headers other than Content-Length are ignored.
class MessageFramer
{
  public:
    explicit MessageFramer(ITransport& transport) : transport_(transport) {}

    /// Read one complete message body
    /// @throws TransportError on invalid framing
    /// @throws ConnectionClosedError if the stream ends before a message is complete
    std::string read_message();

    /// Write one message with its Content-Length header
    void write_message(const std::string& message);

  private:
    /// Pull more bytes into buffer_; returns false on EOF
    bool fill();

    ITransport& transport_;
    std::string buffer_;
};

// =============================================================================
// Transports
// =============================================================================

/// Transport over a pair of POSIX file descriptors
///
/// Used by a bridge process to talk over its own stdin/stdout.
class FdTransport : public ITransport
{
  public:
    /// @param owns_fds Close the descriptors on destruction
    FdTransport(int read_fd, int write_fd, bool owns_fds = true)
        : read_fd_(read_fd), write_fd_(write_fd), owns_fds_(owns_fds), open_(true)
    {
    }

    ~FdTransport() override
    {
        close();
    }

    FdTransport(const FdTransport&) = delete;
    FdTransport& operator=(const FdTransport&) = delete;

    size_t read(char* buffer, size_t size) override;
    void write(const char* data, size_t size) override;
    using ITransport::write;
    void close() override;
    bool is_open() const override
    {
        return open_;
    }

  private:
    int read_fd_;
    int write_fd_;
    bool owns_fds_;
    std::atomic<bool> open_;
};

/// Transport over the stdio pipes of a spawned Process
///
/// The pipes stay owned by the Process; closing the transport only stops using them.
class PipeTransport : public ITransport
{
  public:
    /// @note The pipes must outlive this transport
    PipeTransport(WritePipe& write_pipe, ReadPipe& read_pipe)
        : write_pipe_(&write_pipe), read_pipe_(&read_pipe), open_(true)
    {
    }

    PipeTransport(const PipeTransport&) = delete;
    PipeTransport& operator=(const PipeTransport&) = delete;

    size_t read(char* buffer, size_t size) override;
    void write(const char* data, size_t size) override;
    using ITransport::write;
    void close() override;
    bool is_open() const override
    {
        return open_;
    }

  private:
    WritePipe* write_pipe_;
    ReadPipe* read_pipe_;
    std::atomic<bool> open_;
};

} // namespace chatconsole
