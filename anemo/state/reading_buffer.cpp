#include <anemo/state/reading_buffer.hpp>

ReadingBuffer::ReadingBuffer()
    : storage(std::make_unique<Storage>()),
      appended(0),
      evicted(0) {}

bool ReadingBuffer::append(const Reading& reading) {
    std::lock_guard<std::mutex> lock(mutex);
    bool dropped = storage->pushOverwrite(reading);
    ++appended;
    if (dropped) {
        ++evicted;
    }
    return dropped;
}

std::vector<Reading> ReadingBuffer::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<Reading> out;
    out.reserve(storage->getCount());
    for (std::size_t i = 0; i < storage->getCount(); ++i) {
        out.push_back(storage->at(i));
    }
    return out;
}

bool ReadingBuffer::latest(Reading& out_reading) const {
    std::lock_guard<std::mutex> lock(mutex);
    return storage->peekNewest(out_reading);
}

std::size_t ReadingBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return storage->getCount();
}

bool ReadingBuffer::empty() const {
    std::lock_guard<std::mutex> lock(mutex);
    return storage->isEmpty();
}

void ReadingBuffer::clear() {
    std::lock_guard<std::mutex> lock(mutex);
    storage->clear();
}

uint64_t ReadingBuffer::appendedCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return appended;
}

uint64_t ReadingBuffer::evictedCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return evicted;
}
