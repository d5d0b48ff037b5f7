// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include "fake_agent_client.hpp"

#include <chatconsole/activity_stream.hpp>
#include <gtest/gtest.h>

using namespace chatconsole;

TEST(CancellationTest, DefaultTokenNeverCancels)
{
    CancellationToken token;
    EXPECT_FALSE(token.is_cancellation_requested());
    EXPECT_FALSE(CancellationToken::none().is_cancellation_requested());
}

TEST(CancellationTest, TokensShareTheSourceFlag)
{
    CancellationSource source;
    auto a = source.token();
    auto b = a;

    EXPECT_FALSE(a.is_cancellation_requested());
    source.cancel();
    EXPECT_TRUE(source.is_cancellation_requested());
    EXPECT_TRUE(a.is_cancellation_requested());
    EXPECT_TRUE(b.is_cancellation_requested());
}

TEST(ActivityStreamTest, YieldsTurnsInOrder)
{
    auto stream = make_stream({message("one"), message("two")});

    ASSERT_TRUE(stream.next());
    EXPECT_EQ(stream.current()->text, "one");
    ASSERT_TRUE(stream.next());
    EXPECT_EQ(stream.current()->text, "two");
    EXPECT_FALSE(stream.next());
    EXPECT_TRUE(stream.finished());
    EXPECT_EQ(stream.current(), nullptr);

    // Stays finished
    EXPECT_FALSE(stream.next());
}

TEST(ActivityStreamTest, NullTurnIsDelivered)
{
    auto stream = make_stream({message("before"), nullptr, message("after")});

    ASSERT_TRUE(stream.next());
    ASSERT_TRUE(stream.next());
    EXPECT_EQ(stream.current(), nullptr);
    ASSERT_TRUE(stream.next());
    EXPECT_EQ(stream.current()->text, "after");
}

TEST(ActivityStreamTest, EmptyStream)
{
    auto stream = make_stream({});
    EXPECT_FALSE(stream.finished());
    EXPECT_FALSE(stream.next());
    EXPECT_TRUE(stream.finished());
}

TEST(ActivityStreamTest, CancellationStopsTheStream)
{
    CancellationSource source;
    auto stream = make_stream({message("one"), message("two")}, source.token());

    ASSERT_TRUE(stream.next());
    source.cancel();
    EXPECT_FALSE(stream.next());
    EXPECT_TRUE(stream.finished());
}

TEST(ActivityStreamTest, MovedFromStreamIsExhausted)
{
    auto stream = make_stream({message("one")});
    ActivityStream moved = std::move(stream);

    ASSERT_TRUE(moved.next());
    EXPECT_EQ(moved.current()->text, "one");
}

namespace
{

class FailingSource : public IActivitySource
{
  public:
    bool pull(std::shared_ptr<const Activity>&, const CancellationToken&) override
    {
        throw std::runtime_error("bridge went away");
    }
};

} // namespace

TEST(ActivityStreamTest, SourceErrorsPropagate)
{
    ActivityStream stream(std::make_unique<FailingSource>(), CancellationToken{});
    EXPECT_THROW(stream.next(), std::runtime_error);
}
