// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file reply_printer.hpp
/// @brief Console rendering of reply turns, including adaptive-card follow-ups

#include <chatconsole/agent_client.hpp>
#include <chatconsole/console_input.hpp>
#include <ostream>

namespace chatconsole
{

/// Prints reply streams and answers the adaptive cards they carry
///
/// - `message`: text, then suggested actions, then every adaptive card is
///   filled in and the answers are sent back as a new question. The follow-up
///   reply is printed in full before the next attachment or turn.
/// - `typing`: `.`
/// - `event`: `+`
/// - anything else: the type in brackets
///
/// Follow-ups are kept on an explicit stack of open streams, so chains of
/// cards of any length do not grow the call stack.
class ReplyPrinter
{
  public:
    ReplyPrinter(IAgentClient& client, ConsoleInput& input, std::ostream& out)
        : client_(client), input_(input), out_(out)
    {
    }

    /// Print every turn of `stream` and of the follow-ups it triggers
    void print(ActivityStream stream, const CancellationToken& token);

    /// Print a single turn without resolving its attachments
    void print_activity(const Activity& activity);

  private:
    IAgentClient& client_;
    ConsoleInput& input_;
    std::ostream& out_;
};

} // namespace chatconsole
