/**
 * @file test_channel.cpp
 * @brief Unit tests for Channel.
 */

#include "core/channel.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <thread>

using namespace node_agent;
using namespace std::chrono_literals;

TEST(ChannelTest, FifoOrder) {
    Channel<int> ch;
    ch.send(1);
    ch.send(2);
    ch.send(3);
    EXPECT_EQ(ch.size(), 3u);
    EXPECT_EQ(ch.try_receive().value_or(-1), 1);
    EXPECT_EQ(ch.try_receive().value_or(-1), 2);
    EXPECT_EQ(ch.try_receive().value_or(-1), 3);
    EXPECT_FALSE(ch.try_receive().has_value());
}

TEST(ChannelTest, ReceiveForTimesOut) {
    Channel<int> ch;
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(ch.receive_for(20ms).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 20ms);
}

TEST(ChannelTest, ReceiveWakesOnSend) {
    Channel<int> ch;
    std::jthread producer([&ch] {
        std::this_thread::sleep_for(10ms);
        ch.send(7);
    });
    std::stop_source never;
    EXPECT_EQ(ch.receive(never.get_token()).value_or(-1), 7);
}

TEST(ChannelTest, StopTokenInterruptsReceive) {
    Channel<int> ch;
    std::stop_source stop;
    std::jthread stopper([&stop] {
        std::this_thread::sleep_for(10ms);
        stop.request_stop();
    });
    EXPECT_FALSE(ch.receive(stop.get_token()).has_value());
}

TEST(ChannelTest, CloseDrainsThenEnds) {
    Channel<int> ch;
    ch.send(1);
    ch.close();
    EXPECT_TRUE(ch.closed());
    EXPECT_FALSE(ch.send(2));

    std::stop_source never;
    EXPECT_EQ(ch.receive(never.get_token()).value_or(-1), 1);
    EXPECT_FALSE(ch.receive(never.get_token()).has_value());
}
