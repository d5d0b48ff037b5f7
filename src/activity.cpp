// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <array>
#include <chatconsole/activity.hpp>
#include <stdexcept>

namespace chatconsole
{

namespace
{

constexpr std::array<const char*, 13> kKnownFields = {
    "type",
    "id",
    "text",
    "timestamp",
    "channelId",
    "replyToId",
    "name",
    "from",
    "recipient",
    "conversation",
    "suggestedActions",
    "attachments",
    "value",
};

bool is_known_field(const std::string& key)
{
    for (const char* field : kKnownFields)
        if (key == field)
            return true;
    return false;
}

std::optional<std::string> optional_string(const json& j, const char* key)
{
    if (j.contains(key) && j.at(key).is_string())
        return j.at(key).get<std::string>();
    return std::nullopt;
}

} // namespace

void to_json(json& j, const Activity& a)
{
    j = json{{"type", a.type}};
    if (a.id)
        j["id"] = *a.id;
    if (a.timestamp)
        j["timestamp"] = *a.timestamp;
    if (a.channel_id)
        j["channelId"] = *a.channel_id;
    if (a.from)
        j["from"] = *a.from;
    if (a.conversation)
        j["conversation"] = *a.conversation;
    if (a.recipient)
        j["recipient"] = *a.recipient;
    if (a.text)
        j["text"] = *a.text;
    if (a.name)
        j["name"] = *a.name;
    if (a.suggested_actions)
        j["suggestedActions"] = *a.suggested_actions;
    if (!a.attachments.empty())
        j["attachments"] = a.attachments;
    if (a.reply_to_id)
        j["replyToId"] = *a.reply_to_id;
    if (!a.value.is_null())
        j["value"] = a.value;
    for (const auto& [key, value] : a.extension_data)
        j[key] = value;
}

void from_json(const json& j, Activity& a)
{
    if (!j.is_object())
        throw std::invalid_argument("activity must be a JSON object");

    if (j.contains("type") && j.at("type").is_string())
        j.at("type").get_to(a.type);
    a.id = optional_string(j, "id");
    a.text = optional_string(j, "text");
    a.timestamp = optional_string(j, "timestamp");
    a.channel_id = optional_string(j, "channelId");
    a.reply_to_id = optional_string(j, "replyToId");
    a.name = optional_string(j, "name");
    if (j.contains("from") && j.at("from").is_object())
        a.from = j.at("from").get<ChannelAccount>();
    if (j.contains("recipient") && j.at("recipient").is_object())
        a.recipient = j.at("recipient").get<ChannelAccount>();
    if (j.contains("conversation") && j.at("conversation").is_object())
        a.conversation = j.at("conversation").get<ConversationAccount>();
    if (j.contains("suggestedActions") && j.at("suggestedActions").is_object())
        a.suggested_actions = j.at("suggestedActions").get<SuggestedActions>();
    if (j.contains("attachments") && j.at("attachments").is_array())
        a.attachments = j.at("attachments").get<std::vector<Attachment>>();
    if (j.contains("value"))
        a.value = j.at("value");

    for (const auto& [key, value] : j.items())
        if (!is_known_field(key))
            a.extension_data[key] = value;
}

std::string format_activity_log(const Activity& activity)
{
    json j = activity;
    return j.dump(2);
}

} // namespace chatconsole
