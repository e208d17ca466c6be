#ifndef EVENT_WAITER_HPP
#define EVENT_WAITER_HPP

#include <anemo/models/sensor_event.hpp>
#include <chrono>
#include <vector>

// Drains `queue` into `seen` until an event of `type` arrives or timeout_ms passes
inline bool waitForEvent(SensorEventQueue& queue, SensorEventType type, uint32_t timeout_ms,
                         std::vector<SensorEvent>& seen, SensorEvent* out_event = nullptr) {
    std::chrono::steady_clock::time_point deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        SensorEvent ev;
        if (!queue.receive(ev, 10)) {
            continue;
        }
        seen.push_back(ev);
        if (ev.type == type) {
            if (out_event != nullptr) {
                *out_event = ev;
            }
            return true;
        }
    }
    return false;
}

#endif // EVENT_WAITER_HPP
