#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include "BoundedChannel.hpp"

TEST(BoundedChannelTest, FifoAndDrainAfterClose)
{
    BoundedChannel<int> channel(3);
    EXPECT_TRUE(channel.push(1));
    EXPECT_TRUE(channel.push(2));
    channel.close();
    EXPECT_FALSE(channel.push(3));

    int value = 0;
    ASSERT_TRUE(channel.pop(value));
    EXPECT_EQ(value, 1);
    ASSERT_TRUE(channel.pop(value));
    EXPECT_EQ(value, 2);
    EXPECT_FALSE(channel.pop(value));
}

TEST(BoundedChannelTest, CancelDropsPendingItems)
{
    BoundedChannel<int> channel(2);
    channel.push(1);
    channel.cancel();

    int value = 0;
    EXPECT_FALSE(channel.pop(value));
    EXPECT_TRUE(channel.isClosed());
    EXPECT_EQ(channel.size(), 0u);
}

TEST(BoundedChannelTest, ProducerBlocksWhileFull)
{
    BoundedChannel<int> channel(1);
    std::atomic<int> pushed(0);

    std::thread producer([&]()
                         {
                             for (int i = 0; i < 3; ++i)
                             {
                                 channel.push(i);
                                 pushed++;
                             }
                             channel.close(); });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_LE(pushed.load(), 1);
    EXPECT_LE(channel.size(), 1u);

    int value = -1;
    int expected = 0;
    while (channel.pop(value))
    {
        EXPECT_EQ(value, expected++);
    }
    producer.join();
    EXPECT_EQ(expected, 3);
}

TEST(BoundedChannelTest, CloseWakesBlockedProducer)
{
    BoundedChannel<int> channel(1);
    channel.push(0);

    bool accepted = true;
    std::thread producer([&]()
                         { accepted = channel.push(1); });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    channel.cancel();
    producer.join();
    EXPECT_FALSE(accepted);
}

TEST(BoundedChannelTest, UnboundedNeverBlocks)
{
    BoundedChannel<int> channel;
    for (int i = 0; i < 1000; ++i)
    {
        ASSERT_TRUE(channel.push(i));
    }
    EXPECT_EQ(channel.size(), 1000u);
}
