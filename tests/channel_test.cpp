#include "batchdl/channel.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using batchdl::Channel;

TEST(Channel, DeliversInFifoOrder) {
    Channel<int> channel;
    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(channel.send(i));
    }
    EXPECT_EQ(channel.size(), 5u);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(channel.receive(), i);
    }
    EXPECT_FALSE(channel.tryReceive().has_value());
}

TEST(Channel, CloseDrainsRemainingValues) {
    Channel<int> channel;
    channel.send(1);
    channel.send(2);
    channel.close();

    EXPECT_TRUE(channel.closed());
    EXPECT_FALSE(channel.send(3));
    EXPECT_EQ(channel.receive(), 1);
    EXPECT_EQ(channel.receive(), 2);
    EXPECT_FALSE(channel.receive().has_value());
}

TEST(Channel, CloseWakesBlockedReceiver) {
    Channel<int> channel;
    std::thread closer([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        channel.close();
    });

    EXPECT_FALSE(channel.receive().has_value());
    closer.join();
}

TEST(Channel, BoundedSendBlocksUntilReceive) {
    Channel<int> channel(1);
    channel.send(1);

    std::atomic<bool> sent{false};
    std::thread producer([&] {
        channel.send(2);
        sent = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(sent.load());
    EXPECT_EQ(channel.receive(), 1);
    producer.join();
    EXPECT_TRUE(sent.load());
    EXPECT_EQ(channel.receive(), 2);
}

TEST(Channel, ManyProducersDeliverEverything) {
    Channel<int> channel;
    std::vector<std::thread> producers;
    for (int p = 0; p < 4; ++p) {
        producers.emplace_back([&] {
            for (int i = 0; i < 250; ++i) {
                channel.send(i);
            }
        });
    }
    for (auto& producer : producers) {
        producer.join();
    }
    channel.close();

    int count = 0;
    while (channel.receive()) {
        ++count;
    }
    EXPECT_EQ(count, 1000);
}
