// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <chatconsole/adaptive_card.hpp>
#include <chatconsole/logging.hpp>
#include <chatconsole/reply_printer.hpp>
#include <chrono>
#include <vector>

namespace chatconsole
{

namespace
{

/// An open reply stream and the turn whose attachments are being worked through
struct Frame
{
    ActivityStream stream;
    std::shared_ptr<const Activity> activity;
    size_t next_attachment = 0;
};

} // namespace

void ReplyPrinter::print_activity(const Activity& activity)
{
    if (activity.type == activity_types::kMessage)
    {
        out_ << activity.text.value_or("") << "\n";
        if (activity.suggested_actions && !activity.suggested_actions->actions.empty())
        {
            out_ << "Suggested actions:\n\n";
            for (const auto& action : activity.suggested_actions->actions)
                out_ << "\t" << action.text.value_or(action.title) << "\n";
        }
    }
    else if (activity.type == activity_types::kTyping)
    {
        out_ << ".";
    }
    else if (activity.type == activity_types::kEvent)
    {
        out_ << "+";
    }
    else
    {
        out_ << "[" << activity.type << "]";
    }
    out_ << std::flush;
}

void ReplyPrinter::print(ActivityStream stream, const CancellationToken& token)
{
    std::vector<Frame> stack;
    stack.push_back(Frame{std::move(stream), nullptr, 0});
    auto last_turn = std::chrono::steady_clock::now();

    while (!stack.empty())
    {
        Frame& top = stack.back();

        // Finish the attachments of the current turn before pulling the next one
        if (top.activity)
        {
            if (top.next_attachment < top.activity->attachments.size())
            {
                const Attachment& attachment = top.activity->attachments[top.next_attachment++];
                if (attachment.content_type != kAdaptiveCardContentType)
                    continue;

                CardAnswers answers = resolve_adaptive_card(attachment.content, input_, out_, token);
                if (answers.empty())
                    continue;

                out_ << "\nSending your inputs to the agent...\n\n" << std::flush;
                ActivityStream follow_up = client_.ask_question(answers.dump(), std::nullopt, token);
                // `top` is invalidated by the push
                stack.push_back(Frame{std::move(follow_up), nullptr, 0});
                continue;
            }
            top.activity.reset();
        }

        if (!top.stream.next())
        {
            stack.pop_back();
            continue;
        }

        auto now = std::chrono::steady_clock::now();
        CHATCONSOLE_LOG_DEBUG(
            "Message loop duration: " +
            std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(now - last_turn).count()) + " ms"
        );
        last_turn = now;

        std::shared_ptr<const Activity> activity = top.stream.current();
        if (!activity)
        {
            CHATCONSOLE_LOG_WARN("Skipping empty reply turn");
            continue;
        }

        print_activity(*activity);
        if (activity->type == activity_types::kMessage && !activity->attachments.empty())
            top.activity = std::move(activity);
    }
}

} // namespace chatconsole
