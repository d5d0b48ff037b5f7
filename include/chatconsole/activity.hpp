// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file activity.hpp
/// @brief Conversation turn (activity) types exchanged with the agent client

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace chatconsole
{

// =============================================================================
// Type Aliases
// =============================================================================

/// JSON type alias for cleaner API
using json = nlohmann::json;

/// Insertion-ordered JSON, used where key order is visible to the agent
using ordered_json = nlohmann::ordered_json;

// =============================================================================
// Well-known values
// =============================================================================

namespace activity_types
{
inline constexpr const char* kMessage = "message";
inline constexpr const char* kTyping = "typing";
inline constexpr const char* kEvent = "event";
inline constexpr const char* kEndOfConversation = "endOfConversation";
} // namespace activity_types

/// Attachment content type of an adaptive card
inline constexpr const char* kAdaptiveCardContentType = "application/vnd.microsoft.card.adaptive";

// =============================================================================
// Nested Types
// =============================================================================

/// Sender or recipient of an activity
struct ChannelAccount
{
    std::string id;
    std::optional<std::string> name;
    std::optional<std::string> role;
};

inline void to_json(json& j, const ChannelAccount& a)
{
    j = json{{"id", a.id}};
    if (a.name)
        j["name"] = *a.name;
    if (a.role)
        j["role"] = *a.role;
}

inline void from_json(const json& j, ChannelAccount& a)
{
    if (j.contains("id") && j.at("id").is_string())
        j.at("id").get_to(a.id);
    if (j.contains("name") && j.at("name").is_string())
        a.name = j.at("name").get<std::string>();
    if (j.contains("role") && j.at("role").is_string())
        a.role = j.at("role").get<std::string>();
}

/// Conversation an activity belongs to
struct ConversationAccount
{
    std::string id;
    std::optional<std::string> name;
    std::optional<std::string> conversation_type;
};

inline void to_json(json& j, const ConversationAccount& c)
{
    j = json{{"id", c.id}};
    if (c.name)
        j["name"] = *c.name;
    if (c.conversation_type)
        j["conversationType"] = *c.conversation_type;
}

inline void from_json(const json& j, ConversationAccount& c)
{
    if (j.contains("id") && j.at("id").is_string())
        j.at("id").get_to(c.id);
    if (j.contains("name") && j.at("name").is_string())
        c.name = j.at("name").get<std::string>();
    if (j.contains("conversationType") && j.at("conversationType").is_string())
        c.conversation_type = j.at("conversationType").get<std::string>();
}

/// A clickable action offered alongside a message
struct CardAction
{
    std::string type;
    std::string title;
    std::optional<std::string> text;
    json value;
};

inline void to_json(json& j, const CardAction& a)
{
    j = json{{"type", a.type}, {"title", a.title}};
    if (a.text)
        j["text"] = *a.text;
    if (!a.value.is_null())
        j["value"] = a.value;
}

inline void from_json(const json& j, CardAction& a)
{
    if (j.contains("type") && j.at("type").is_string())
        j.at("type").get_to(a.type);
    if (j.contains("title") && j.at("title").is_string())
        j.at("title").get_to(a.title);
    if (j.contains("text") && j.at("text").is_string())
        a.text = j.at("text").get<std::string>();
    if (j.contains("value"))
        a.value = j.at("value");
}

/// Suggested replies the operator may pick from
struct SuggestedActions
{
    std::vector<std::string> to;
    std::vector<CardAction> actions;
};

inline void to_json(json& j, const SuggestedActions& s)
{
    j = json{{"actions", s.actions}};
    if (!s.to.empty())
        j["to"] = s.to;
}

inline void from_json(const json& j, SuggestedActions& s)
{
    if (j.contains("to") && j.at("to").is_array())
        s.to = j.at("to").get<std::vector<std::string>>();
    if (j.contains("actions") && j.at("actions").is_array())
        s.actions = j.at("actions").get<std::vector<CardAction>>();
}

/// Structured payload attached to a message (adaptive card, hero card, file...)
struct Attachment
{
    std::string content_type;
    json content;
    std::optional<std::string> content_url;
    std::optional<std::string> name;
};

inline void to_json(json& j, const Attachment& a)
{
    j = json{{"contentType", a.content_type}};
    if (!a.content.is_null())
        j["content"] = a.content;
    if (a.content_url)
        j["contentUrl"] = *a.content_url;
    if (a.name)
        j["name"] = *a.name;
}

inline void from_json(const json& j, Attachment& a)
{
    if (j.contains("contentType") && j.at("contentType").is_string())
        j.at("contentType").get_to(a.content_type);
    if (j.contains("content"))
        a.content = j.at("content");
    if (j.contains("contentUrl") && j.at("contentUrl").is_string())
        a.content_url = j.at("contentUrl").get<std::string>();
    if (j.contains("name") && j.at("name").is_string())
        a.name = j.at("name").get<std::string>();
}

// =============================================================================
// Activity
// =============================================================================

/// One conversation turn received from (or sent to) the agent
///
/// Only the fields the console reads are modelled; everything else the agent
/// sends is kept verbatim in `extension_data` so logged activities stay complete.
struct Activity
{
    std::string type;
    std::optional<std::string> id;
    std::optional<std::string> text;
    std::optional<std::string> timestamp;
    std::optional<std::string> channel_id;
    std::optional<std::string> reply_to_id;
    std::optional<std::string> name;
    std::optional<ChannelAccount> from;
    std::optional<ChannelAccount> recipient;
    std::optional<ConversationAccount> conversation;
    std::optional<SuggestedActions> suggested_actions;
    std::vector<Attachment> attachments;
    json value;
    std::map<std::string, json> extension_data;

    bool has_text() const
    {
        return text.has_value() && !text->empty();
    }

    /// Conversation id, or an empty string when the turn carries none
    std::string conversation_id() const
    {
        return conversation ? conversation->id : std::string{};
    }
};

void to_json(json& j, const Activity& a);
void from_json(const json& j, Activity& a);

/// Serialize an activity for the batch response log (indented, camelCase)
std::string format_activity_log(const Activity& activity);

} // namespace chatconsole
