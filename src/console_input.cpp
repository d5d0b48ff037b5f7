// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <chatconsole/console_input.hpp>
#include <condition_variable>
#include <deque>
#include <mutex>

namespace chatconsole
{

namespace
{

constexpr auto kWaitSlice = std::chrono::milliseconds(100);
constexpr auto kDetachGrace = std::chrono::milliseconds(250);

} // namespace

struct ConsoleInput::State
{
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::string> lines;
    bool eof = false;
};

ConsoleInput::ConsoleInput(std::istream& in) : state_(std::make_shared<State>())
{
    // The reader holds its own reference to the state so it can be detached
    // while still blocked on the stream
    reader_ = std::thread(
        [state = state_, &in]()
        {
            std::string line;
            while (std::getline(in, line))
            {
                if (!line.empty() && line.back() == '\r')
                    line.pop_back();
                {
                    std::lock_guard<std::mutex> lock(state->mutex);
                    state->lines.push_back(std::move(line));
                }
                state->cv.notify_all();
                line.clear();
            }
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                state->eof = true;
            }
            state->cv.notify_all();
        }
    );
}

ConsoleInput::~ConsoleInput()
{
    bool finished;
    {
        std::unique_lock<std::mutex> lock(state_->mutex);
        finished = state_->cv.wait_for(lock, kDetachGrace, [this] { return state_->eof; });
    }
    // A reader blocked on an interactive console cannot be woken up
    if (finished)
        reader_.join();
    else
        reader_.detach();
}

std::optional<std::string> ConsoleInput::read_line(const CancellationToken& token)
{
    std::unique_lock<std::mutex> lock(state_->mutex);
    while (true)
    {
        if (!state_->lines.empty())
        {
            std::string line = std::move(state_->lines.front());
            state_->lines.pop_front();
            return line;
        }
        if (state_->eof || token.is_cancellation_requested())
            return std::nullopt;
        state_->cv.wait_for(lock, kWaitSlice);
    }
}

std::optional<std::string> ConsoleInput::read_line_for(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(state_->mutex);
    bool ready = state_->cv.wait_for(
        lock, timeout, [this] { return !state_->lines.empty() || state_->eof; }
    );
    if (!ready || state_->lines.empty())
        return std::nullopt;

    std::string line = std::move(state_->lines.front());
    state_->lines.pop_front();
    return line;
}

bool ConsoleInput::at_end() const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->eof && state_->lines.empty();
}

size_t ConsoleInput::discard_pending()
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    size_t dropped = state_->lines.size();
    state_->lines.clear();
    return dropped;
}

} // namespace chatconsole
