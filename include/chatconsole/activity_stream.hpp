// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file activity_stream.hpp
/// @brief Lazily pulled, cancellable sequence of conversation turns

#include <atomic>
#include <chatconsole/activity.hpp>
#include <memory>

namespace chatconsole
{

// =============================================================================
// Cancellation
// =============================================================================

/// Read side of a cancellation flag
///
/// Tokens are cheap to copy and all copies observe the same flag. A default
/// constructed token can never be cancelled.
class CancellationToken
{
  public:
    CancellationToken() = default;

    bool is_cancellation_requested() const
    {
        return flag_ && flag_->load(std::memory_order_acquire);
    }

    /// A token that is never cancelled
    static CancellationToken none()
    {
        return CancellationToken{};
    }

  private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<std::atomic<bool>> flag) : flag_(std::move(flag)) {}

    std::shared_ptr<std::atomic<bool>> flag_;
};

/// Owner of a cancellation flag
///
/// `cancel()` only performs a lock-free atomic store, so it may be called from
/// a signal handler.
class CancellationSource
{
  public:
    CancellationSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept
    {
        flag_->store(true, std::memory_order_release);
    }

    bool is_cancellation_requested() const
    {
        return flag_->load(std::memory_order_acquire);
    }

    CancellationToken token() const
    {
        return CancellationToken{flag_};
    }

  private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

// =============================================================================
// Activity Source
// =============================================================================

/// Producer behind an ActivityStream
///
/// Implementations block until the next turn is available. A turn may be
/// delivered as a null pointer when the client received an empty turn; the
/// consumer decides whether that is acceptable.
class IActivitySource
{
  public:
    virtual ~IActivitySource() = default;

    /// Produce the next turn
    /// @param out Receives the turn (possibly null)
    /// @param token Cancellation checked while waiting
    /// @return false once the sequence is exhausted or cancelled
    virtual bool pull(std::shared_ptr<const Activity>& out, const CancellationToken& token) = 0;
};

// =============================================================================
// ActivityStream
// =============================================================================

/// Forward-only sequence of turns returned by the agent client
///
/// The stream suspends the caller in `next()` until the client delivers the
/// next turn. Dropping the stream early discards whatever the client has not
/// yet delivered.
///
/// Example usage:
/// @code
/// auto stream = client.ask_question("Hello", std::nullopt, token);
/// while (stream.next())
///     if (stream.current()) std::cout << stream.current()->text.value_or("") << "\n";
/// @endcode
class ActivityStream
{
  public:
    ActivityStream(std::unique_ptr<IActivitySource> source, CancellationToken token)
        : source_(std::move(source)), token_(std::move(token))
    {
    }

    // Move-only
    ActivityStream(const ActivityStream&) = delete;
    ActivityStream& operator=(const ActivityStream&) = delete;
    ActivityStream(ActivityStream&&) noexcept = default;
    ActivityStream& operator=(ActivityStream&&) noexcept = default;

    /// Advance to the next turn
    /// @return false when the stream is exhausted or cancellation was requested
    /// @throws whatever the underlying client reports for the turn
    bool next()
    {
        current_.reset();
        if (finished_ || !source_)
            return false;
        if (token_.is_cancellation_requested() || !source_->pull(current_, token_))
        {
            finished_ = true;
            current_.reset();
            return false;
        }
        return true;
    }

    /// Turn produced by the last successful `next()`; may be null
    const std::shared_ptr<const Activity>& current() const
    {
        return current_;
    }

    bool finished() const
    {
        return finished_;
    }

  private:
    std::unique_ptr<IActivitySource> source_;
    CancellationToken token_;
    std::shared_ptr<const Activity> current_;
    bool finished_ = false;
};

} // namespace chatconsole
