#ifndef SENSOR_EVENT_HPP
#define SENSOR_EVENT_HPP

#include <anemo/config/config.hpp>
#include <anemo/models/reading.hpp>
#include <anemo/models/sensor_info.hpp>
#include <anemo/utils/message_queue.hpp>
#include <cstdint>
#include <string>

// Messages from a worker (or the scheduler) to the owning sensor controller
enum class SensorEventType : uint8_t {
    STATUS = 0,         // connected flag changed
    ERROR = 1,          // non-fatal or fatal error text
    PROGRESS = 2,       // initialization step
    SENSOR_INFO = 3,    // negotiation result
    READING = 4,        // one parsed sample
    RECONNECT_DUE = 5,  // backoff delay elapsed
};

struct SensorEvent {
    SensorEventType    type = SensorEventType::STATUS;
    uint32_t           generation = 0;  // worker instance that produced the event
    bool               connected = false;
    std::string        text;
    NegotiatedProtocol protocol;
    Reading            reading;
};

typedef MessageQueue<SensorEvent, Config::Tasks::Controller::event_queue_len> SensorEventQueue;

#endif // SENSOR_EVENT_HPP
