// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file console_input.hpp
/// @brief Line reader over an input stream with timeouts and cancellation

#include <chatconsole/activity_stream.hpp>
#include <chrono>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace chatconsole
{

/// Reads lines from a stream on a background thread
///
/// A line that arrives after a timed read gave up is kept and returned by the
/// next read, so nothing the operator types is lost. Trailing `\r` is stripped.
class ConsoleInput
{
  public:
    /// @param in Stream to read; must outlive this object
    explicit ConsoleInput(std::istream& in);
    ~ConsoleInput();

    ConsoleInput(const ConsoleInput&) = delete;
    ConsoleInput& operator=(const ConsoleInput&) = delete;

    /// Block until a line arrives
    /// @return The line, or std::nullopt on end of input or cancellation
    std::optional<std::string> read_line(const CancellationToken& token = CancellationToken::none());

    /// Wait at most `timeout` for a line
    /// @return The line, or std::nullopt on timeout or end of input
    std::optional<std::string> read_line_for(std::chrono::milliseconds timeout);

    /// True once the stream is exhausted and every buffered line was consumed
    bool at_end() const;

    /// Drop lines typed ahead of the next prompt
    /// @return Number of lines dropped
    size_t discard_pending();

  private:
    struct State;

    std::shared_ptr<State> state_;
    std::thread reader_;
};

} // namespace chatconsole
