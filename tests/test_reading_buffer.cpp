#include <gtest/gtest.h>
#include <anemo/state/reading_buffer.hpp>
#include "support/reading_factory.hpp"
#include <thread>

TEST(ReadingBuffer, KeepsLastCapacityReadingsInOrder) {
    ReadingBuffer buffer;
    const std::size_t total = ReadingBuffer::capacity + 1;
    std::size_t evictions = 0;
    for (std::size_t i = 0; i < total; ++i) {
        if (buffer.append(makeReading("Sensor1", static_cast<int64_t>(i)))) {
            ++evictions;
        }
    }
    EXPECT_EQ(1u, evictions);
    EXPECT_EQ(ReadingBuffer::capacity, buffer.size());
    EXPECT_EQ(total, buffer.appendedCount());
    EXPECT_EQ(1u, buffer.evictedCount());

    std::vector<Reading> all = buffer.snapshot();
    ASSERT_EQ(ReadingBuffer::capacity, all.size());
    EXPECT_EQ(1, all.front().timestampMs());
    EXPECT_EQ(static_cast<int64_t>(ReadingBuffer::capacity), all.back().timestampMs());
    for (std::size_t i = 1; i < all.size(); ++i) {
        ASSERT_EQ(all[i - 1].timestampMs() + 1, all[i].timestampMs());
    }
}

TEST(ReadingBuffer, LatestAndClear) {
    ReadingBuffer buffer;
    Reading r;
    EXPECT_FALSE(buffer.latest(r));
    EXPECT_TRUE(buffer.empty());

    buffer.append(makeReading("Sensor1", 10, 1.0));
    buffer.append(makeReading("Sensor1", 20, 2.0));
    ASSERT_TRUE(buffer.latest(r));
    EXPECT_EQ(20, r.timestampMs());
    EXPECT_DOUBLE_EQ(2.0, r.speed2d());

    buffer.clear();
    EXPECT_TRUE(buffer.empty());
    EXPECT_FALSE(buffer.latest(r));
    // Lifetime counters survive a clear
    EXPECT_EQ(2u, buffer.appendedCount());
}

TEST(ReadingBuffer, SnapshotWhileWriting) {
    ReadingBuffer buffer;
    std::thread writer([&buffer]() {
        for (int i = 0; i < 5000; ++i) {
            buffer.append(makeReading("Sensor1", i));
        }
    });
    for (int i = 0; i < 50; ++i) {
        std::vector<Reading> snap = buffer.snapshot();
        for (std::size_t j = 1; j < snap.size(); ++j) {
            ASSERT_LT(snap[j - 1].timestampMs(), snap[j].timestampMs());
        }
    }
    writer.join();
    EXPECT_EQ(5000u, buffer.size());
}
