#ifndef CONNECTION_STATE_HPP
#define CONNECTION_STATE_HPP

#include <anemo/models/sensor_info.hpp>
#include <string>

// Per-sensor link status, owned by the sensor's controller and changed only
// while it processes events from its own worker.
struct ConnectionState {
    bool connected = false;
    // Scheduled reconnects since the last successful connection
    int reconnect_attempts = 0;
    bool reconnect_pending = false;
    // Backoff used up; only a manual connect starts over
    bool reconnect_exhausted = false;
    std::string last_error;
    std::string last_progress;
    NegotiatedProtocol protocol;
};

#endif // CONNECTION_STATE_HPP
