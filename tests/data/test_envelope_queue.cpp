#include "tempest/data/envelope_queue.hpp"

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

using namespace tempest::data;

TEST(SPSCQueue, PushPop) {
    SPSCQueue<int> q(4);
    int val = 0;

    EXPECT_TRUE(q.empty());
    EXPECT_TRUE(q.try_push(42));
    EXPECT_FALSE(q.empty());
    EXPECT_TRUE(q.try_pop(val));
    EXPECT_EQ(val, 42);
    EXPECT_TRUE(q.empty());
}

TEST(SPSCQueue, PopFromEmpty) {
    SPSCQueue<int> q(4);
    int val = 0;
    EXPECT_FALSE(q.try_pop(val));
}

TEST(SPSCQueue, FullQueueCountsDrops) {
    SPSCQueue<int> q(4); // usable capacity = 3
    EXPECT_TRUE(q.try_push(1));
    EXPECT_TRUE(q.try_push(2));
    EXPECT_TRUE(q.try_push(3));
    EXPECT_FALSE(q.try_push(4));
    EXPECT_FALSE(q.try_push(5));
    EXPECT_EQ(q.capacity(), 3u);
    EXPECT_EQ(q.dropped(), 2u);

    int val = 0;
    EXPECT_TRUE(q.try_pop(val));
    EXPECT_EQ(val, 1);
    EXPECT_TRUE(q.try_push(6));
}

TEST(SPSCQueue, TinyCapacityIsClamped) {
    SPSCQueue<int> q(0);
    EXPECT_EQ(q.capacity(), 1u);
    EXPECT_TRUE(q.try_push(1));
    EXPECT_FALSE(q.try_push(2));
}

TEST(SPSCQueue, WrapAround) {
    SPSCQueue<int> q(4);
    for (int round = 0; round < 5; ++round) {
        for (int i = 0; i < 3; ++i) {
            EXPECT_TRUE(q.try_push(round * 10 + i));
        }
        int val = 0;
        for (int i = 0; i < 3; ++i) {
            EXPECT_TRUE(q.try_pop(val));
            EXPECT_EQ(val, round * 10 + i);
        }
    }
    EXPECT_EQ(q.dropped(), 0u);
}

TEST(EnvelopeQueue, CarriesTextAndOrigin) {
    EnvelopeQueue q(16);
    const std::string text = R"({"type":"connection_opened"})";

    EXPECT_TRUE(q.try_push(RawEnvelope{text, "cloud"}));

    RawEnvelope out;
    EXPECT_TRUE(q.try_pop(out));
    EXPECT_EQ(out.text, text);
    EXPECT_EQ(out.origin, "cloud");
}

TEST(SPSCQueue, MultithreadedStress) {
    constexpr int kCount = 10000;
    SPSCQueue<int> q(256);

    std::thread producer([&] {
        for (int i = 0; i < kCount; ++i) {
            int item = i;
            while (!q.try_push(std::move(item))) {
                // spin
            }
        }
    });

    std::vector<int> received;
    received.reserve(kCount);

    std::thread consumer([&] {
        int val = 0;
        while (static_cast<int>(received.size()) < kCount) {
            if (q.try_pop(val)) {
                received.push_back(val);
            }
        }
    });

    producer.join();
    consumer.join();

    ASSERT_EQ(received.size(), static_cast<size_t>(kCount));
    for (int i = 0; i < kCount; ++i) {
        EXPECT_EQ(received[i], i) << "Mismatch at index " << i;
    }
}
