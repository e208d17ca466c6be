#ifndef READING_BUFFER_HPP
#define READING_BUFFER_HPP

#include <anemo/config/config.hpp>
#include <anemo/models/reading.hpp>
#include <anemo/utils/circular_buffer.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

// Per-sensor history. Written by that sensor's acquisition thread, read by
// anyone. Once full, each append evicts the oldest reading.
class ReadingBuffer {
public:
    static constexpr std::size_t capacity = Config::Acquisition::buffer_capacity;

    ReadingBuffer();

    ReadingBuffer(const ReadingBuffer&) = delete;
    ReadingBuffer& operator=(const ReadingBuffer&) = delete;

    // Returns true if the oldest reading was evicted to make room
    bool append(const Reading& reading);

    // Copy of the contents, oldest first
    std::vector<Reading> snapshot() const;

    bool latest(Reading& out_reading) const;

    std::size_t size() const;
    bool empty() const;
    void clear();

    // Lifetime counters; clear() does not reset them
    uint64_t appendedCount() const;
    uint64_t evictedCount() const;

private:
    typedef CircularBuffer<Reading, capacity> Storage;

    mutable std::mutex mutex;
    std::unique_ptr<Storage> storage;
    uint64_t appended;
    uint64_t evicted;
};

#endif // READING_BUFFER_HPP
