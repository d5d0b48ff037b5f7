// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chatconsole/adaptive_card.hpp>
#include <chatconsole/logging.hpp>
#include <cstdint>
#include <optional>

namespace chatconsole
{

namespace
{

std::string trim(const std::string& s)
{
    const char* ws = " \t\r\n\f\v";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos)
        return {};
    return s.substr(start, s.find_last_not_of(ws) - start + 1);
}

/// Text of a JSON value: strings unquoted, anything else serialized
std::optional<std::string> text_of(const json& item, const char* key)
{
    auto it = item.find(key);
    if (it == item.end() || it->is_null())
        return std::nullopt;
    return it->is_string() ? it->get<std::string>() : it->dump();
}

/// Parse a 32-bit integer, allowing surrounding whitespace and a leading sign
std::optional<int32_t> parse_int(const std::string& text)
{
    std::string s = trim(text);
    if (!s.empty() && s.front() == '+')
        s.erase(0, 1);
    if (s.empty())
        return std::nullopt;

    int32_t value = 0;
    auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || end != s.data() + s.size())
        return std::nullopt;
    return value;
}

std::optional<json> parse_card(const json& content)
{
    if (content.is_object())
        return content;
    if (content.is_string())
    {
        json parsed = json::parse(content.get<std::string>(), nullptr, false);
        if (!parsed.is_discarded() && parsed.is_object())
            return parsed;
    }
    return std::nullopt;
}

} // namespace

CardAnswers resolve_adaptive_card(
    const json& content, ConsoleInput& input, std::ostream& out, const CancellationToken& token
)
{
    CardAnswers answers = CardAnswers::object();

    auto card = parse_card(content);
    if (!card || !card->contains("body") || !card->at("body").is_array())
    {
        out << "[!] Adaptive Card body is missing or malformed.\n";
        return answers;
    }

    for (const auto& item : card->at("body"))
    {
        if (!item.is_object())
            continue;

        auto id = text_of(item, "id");
        if (!id || trim(*id).empty())
            continue;

        std::string type = text_of(item, "type").value_or("");
        std::string label = text_of(item, "label").value_or(text_of(item, "placeholder").value_or(*id));

        auto prompt = [&](const std::string& text) -> std::optional<std::string>
        {
            out << text << std::flush;
            return input.read_line(token);
        };

        std::optional<std::string> line;
        if (type == "Input.Text")
        {
            line = prompt(label + ": ");
            if (line)
                answers[*id] = *line;
        }
        else if (type == "Input.Number")
        {
            line = prompt(label + " (number): ");
            if (line)
                if (auto number = parse_int(*line))
                    answers[*id] = *number;
        }
        else if (type == "Input.ChoiceSet")
        {
            auto choices = item.find("choices");
            if (choices == item.end() || !choices->is_array() || choices->empty())
                continue;

            out << label << ":\n";
            for (size_t i = 0; i < choices->size(); ++i)
            {
                const json& choice = (*choices)[i];
                std::string title = choice.is_object() ? text_of(choice, "title").value_or("") : "";
                out << "  " << (i + 1) << ". " << title << "\n";
            }

            line = prompt("Select option number: ");
            auto selected = line ? parse_int(*line) : std::nullopt;
            if (selected && *selected >= 1 && static_cast<size_t>(*selected) <= choices->size())
            {
                const json& choice = (*choices)[static_cast<size_t>(*selected) - 1];
                auto value = choice.is_object() ? text_of(choice, "value") : std::nullopt;
                answers[*id] = value ? json(*value) : json(nullptr);
            }
        }
        else if (type == "Input.Toggle")
        {
            line = prompt(label + " (yes/no): ");
            if (line)
            {
                std::string answer = trim(*line);
                std::transform(
                    answer.begin(),
                    answer.end(),
                    answer.begin(),
                    [](unsigned char c) { return static_cast<char>(std::tolower(c)); }
                );
                answers[*id] = (answer == "yes" || answer == "y")
                                   ? text_of(item, "valueOn").value_or("true")
                                   : text_of(item, "valueOff").value_or("false");
            }
        }
        else if (type == "Input.Date")
        {
            line = prompt(label + " (yyyy-MM-dd): ");
            if (line)
                answers[*id] = *line;
        }
        else if (type == "Input.Time")
        {
            line = prompt(label + " (HH:mm): ");
            if (line)
                answers[*id] = *line;
        }
        else
        {
            continue;
        }

        if (!line)
        {
            // A half-filled form is never sent once the run is cancelled
            if (token.is_cancellation_requested())
                return CardAnswers::object();
            CHATCONSOLE_LOG_DEBUG("Console input ended while filling in a card");
            break;
        }
    }

    return answers;
}

} // namespace chatconsole
