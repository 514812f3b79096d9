#include <gtest/gtest.h>
#include "core/signal_channel.h"
#include <thread>
#include <vector>

using namespace tickagg;

TEST(SignalChannelTest, DeliversInOrder) {
    SignalChannel<int> channel;
    EXPECT_TRUE(channel.send(1));
    EXPECT_TRUE(channel.send(2));
    EXPECT_TRUE(channel.send(3));
    EXPECT_EQ(channel.size(), 3u);

    EXPECT_EQ(channel.receive(), 1);
    EXPECT_EQ(channel.receive(), 2);
    EXPECT_EQ(channel.tryReceive(), 3);
    EXPECT_FALSE(channel.tryReceive().has_value());
}

TEST(SignalChannelTest, SendAfterCloseFails) {
    SignalChannel<int> channel;
    channel.close();

    EXPECT_TRUE(channel.isClosed());
    EXPECT_FALSE(channel.send(1));
    EXPECT_EQ(channel.size(), 0u);
}

TEST(SignalChannelTest, CloseDrainsPendingValues) {
    SignalChannel<int> channel;
    channel.send(7);
    channel.send(8);
    channel.close();

    EXPECT_EQ(channel.receive(), 7);
    EXPECT_EQ(channel.receive(), 8);
    EXPECT_FALSE(channel.receive().has_value());
}

TEST(SignalChannelTest, CloseWakesBlockedReceiver) {
    SignalChannel<int> channel;
    std::optional<int> received = 42;

    std::thread receiver([&]() {
        received = channel.receive();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    channel.close();
    receiver.join();

    EXPECT_FALSE(received.has_value());
}

TEST(SignalChannelTest, UnboundedBacklogIsNotDropped) {
    SignalChannel<int> channel;
    const int count = 10000;

    std::thread producer([&]() {
        for (int i = 0; i < count; ++i) {
            channel.send(i);
        }
        channel.close();
    });

    std::vector<int> received;
    while (auto value = channel.receive()) {
        received.push_back(*value);
    }
    producer.join();

    ASSERT_EQ(received.size(), static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        EXPECT_EQ(received[i], i);
    }
}
