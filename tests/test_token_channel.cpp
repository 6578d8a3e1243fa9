#include "engine/token_channel.hpp"
#include <gtest/gtest.h>
#include <thread>
#include <vector>

using verity::engine::TokenChannel;

TEST(TokenChannel, DeliversInOrderThenEnds) {
    TokenChannel channel;
    std::thread producer([&channel] {
        for (int i = 0; i < 100; ++i) channel.push(std::to_string(i));
        channel.close();
    });

    std::vector<std::string> received;
    std::string token;
    while (channel.pop(token)) received.push_back(token);
    producer.join();

    ASSERT_EQ(received.size(), 100u);
    for (int i = 0; i < 100; ++i) EXPECT_EQ(received[i], std::to_string(i));
}

TEST(TokenChannel, DrainsQueuedItemsAfterClose) {
    TokenChannel channel;
    channel.push("a");
    channel.push("b");
    channel.close();
    channel.push("ignored");

    std::string token;
    ASSERT_TRUE(channel.pop(token));
    EXPECT_EQ(token, "a");
    ASSERT_TRUE(channel.pop(token));
    EXPECT_EQ(token, "b");
    EXPECT_FALSE(channel.pop(token));
}

TEST(TokenChannel, CancelDropsPendingAndWakesConsumer) {
    TokenChannel channel;
    channel.push("pending");
    channel.cancel();
    EXPECT_TRUE(channel.cancelled());
    EXPECT_TRUE(channel.cancel_flag().load());

    std::string token;
    EXPECT_FALSE(channel.pop(token));

    channel.push("late");
    EXPECT_EQ(channel.size(), 1u);
}

TEST(TokenChannel, CancelUnblocksWaitingPop) {
    TokenChannel channel;
    bool result = true;
    std::thread consumer([&] {
        std::string token;
        result = channel.pop(token);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    channel.cancel();
    consumer.join();
    EXPECT_FALSE(result);
}
