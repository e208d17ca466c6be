#ifndef MESSAGE_QUEUE_HPP
#define MESSAGE_QUEUE_HPP

#include <anemo/utils/circular_buffer.hpp>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>

// Bounded inter-thread queue with timed send/receive, in the shape of a
// FreeRTOS queue: a timeout of 0 never blocks, and a full queue rejects the item.
template<typename T, std::size_t Capacity>
class MessageQueue {
public:
    // Blocks up to timeout_ms for free space. The last `reserved` slots are
    // treated as full for this item. Returns false if the item was not queued.
    bool send(const T& item, uint32_t timeout_ms = 0, std::size_t reserved = 0) {
        std::unique_lock<std::mutex> lock(mutex);
        if (!hasRoom(reserved)) {
            if (timeout_ms == 0U) {
                return false;
            }
            if (!not_full.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                   [this, reserved] { return hasRoom(reserved); })) {
                return false;
            }
        }
        (void)items.push(item);
        lock.unlock();
        not_empty.notify_one();
        return true;
    }

    // Blocks up to timeout_ms for an item. Returns false on timeout.
    bool receive(T& out_item, uint32_t timeout_ms) {
        std::unique_lock<std::mutex> lock(mutex);
        if (items.isEmpty()) {
            if (timeout_ms == 0U) {
                return false;
            }
            if (!not_empty.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                    [this] { return !items.isEmpty(); })) {
                return false;
            }
        }
        (void)items.pop(out_item);
        lock.unlock();
        not_full.notify_one();
        return true;
    }

private:
    // Caller holds mutex
    bool hasRoom(std::size_t reserved) const {
        return items.getCount() + reserved < Capacity;
    }

    mutable std::mutex mutex;
    std::condition_variable not_empty;
    std::condition_variable not_full;
    CircularBuffer<T, Capacity> items;
};

#endif // MESSAGE_QUEUE_HPP
