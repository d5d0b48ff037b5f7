// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file agent_client.hpp
/// @brief The agent client seam used by the session runner

#include <chatconsole/activity_stream.hpp>
#include <optional>
#include <string>

namespace chatconsole
{

/// Conversation operations the console needs from an agent client
///
/// Authentication, transport and protocol details live behind this interface.
/// Implementations report failures by throwing; callers never retry.
class IAgentClient
{
  public:
    virtual ~IAgentClient() = default;

    /// Start a new conversation
    /// @param emit_start_event Ask the agent to greet (send its opening turn)
    /// @param token Cancellation honoured between turns
    /// @return Stream of the agent's opening turns
    virtual ActivityStream start_conversation(bool emit_start_event, CancellationToken token) = 0;

    /// Ask a question in the current conversation
    /// @param text Question text
    /// @param conversation_id Conversation to ask in (nullopt = the client's current one)
    /// @param token Cancellation honoured between turns
    /// @return Stream of reply turns
    virtual ActivityStream ask_question(
        const std::string& text,
        const std::optional<std::string>& conversation_id,
        CancellationToken token
    ) = 0;
};

} // namespace chatconsole
