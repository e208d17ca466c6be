#ifndef SENSOR_CONTROLLER_HPP
#define SENSOR_CONTROLLER_HPP

#include <anemo/hardware/serial_port.hpp>
#include <anemo/models/reading.hpp>
#include <anemo/models/sensor_event.hpp>
#include <anemo/models/sensor_link_config.hpp>
#include <anemo/protocol/protocol_negotiator.hpp>
#include <anemo/state/connection_state.hpp>
#include <anemo/state/reading_buffer.hpp>
#include <anemo/tasks/acquisition_worker.hpp>
#include <anemo/utils/scheduler.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

// Presentation-side callbacks, invoked from SensorController::pumpEvents().
class SensorEventListener {
public:
    virtual ~SensorEventListener() {}
    virtual void onConnectionStatus(const std::string& sensor_id, bool connected) { (void)sensor_id; (void)connected; }
    virtual void onError(const std::string& sensor_id, const std::string& message) { (void)sensor_id; (void)message; }
    virtual void onProgress(const std::string& sensor_id, const std::string& step) { (void)sensor_id; (void)step; }
    virtual void onSensorInfo(const std::string& sensor_id, const NegotiatedProtocol& protocol) { (void)sensor_id; (void)protocol; }
    virtual void onReading(const Reading& reading) { (void)reading; }
    virtual void onReconnectExhausted(const std::string& sensor_id, int attempts) { (void)sensor_id; (void)attempts; }
};

typedef std::function<std::unique_ptr<SerialPort>()> SerialPortFactory;

// Creates PosixSerialPort instances
std::unique_ptr<SerialPort> makePosixSerialPort();

// Owns one sensor: its link configuration, reading buffer, worker and
// connection state, and supervises reconnection after link loss.
//
// Worker events are queued and applied by pumpEvents() on the caller's
// context; connect/disconnect/configure must be called from that same context.
class SensorController {
public:
    SensorController(const std::string& sensor_id,
                     TaskScheduler& scheduler,
                     SerialPortFactory port_factory = &makePosixSerialPort,
                     const NegotiationTimings& timings = NegotiationTimings::defaults());
    ~SensorController();

    SensorController(const SensorController&) = delete;
    SensorController& operator=(const SensorController&) = delete;

    // Replaces the link settings and clears the buffer. Rejected while a worker is running.
    bool configure(const SensorLinkConfig& link);
    const SensorLinkConfig& linkConfig() const { return link; }

    // Starts a worker. Returns false if one is already running or the link is not configured.
    bool connect();

    // Cancels any pending reconnect, stops the worker (bounded join) and resets the counter.
    void disconnect();

    // Applies queued worker events; waits up to wait_ms for the first one.
    // Once the queue is drained, a worker that has exited on its own is
    // handled as a lost connection. Returns the number of events handled.
    std::size_t pumpEvents(uint32_t wait_ms);

    void setListener(SensorEventListener* new_listener) { listener = new_listener; }

    // Raw command through the worker's paced write path
    bool sendCommand(const std::string& command);

    // {outputrate N}; only sent to sensors negotiated on the structured protocol
    bool setOutputRate(int rate_hz);

    const std::string& sensorId() const { return id; }
    ConnectionState state() const;
    bool isConnected() const;
    bool hasWorker() const { return worker != nullptr; }

    ReadingBuffer& buffer() { return *readings; }
    const ReadingBuffer& buffer() const { return *readings; }
    void clearBuffer();

    // Overflows counted by all workers of this controller
    uint64_t overflowCount() const;

private:
    void handleEvent(const SensorEvent& event);
    std::size_t checkWorkerExited();
    void onConnectionLost();
    void scheduleReconnect();
    void attemptReconnect();
    bool startWorker();
    void stopWorker(uint32_t join_timeout_ms);
    void cancelReconnect();

    std::string id;
    TaskScheduler& scheduler;
    SerialPortFactory port_factory;
    NegotiationTimings timings;
    SensorLinkConfig link;

    std::shared_ptr<ReadingBuffer> readings;
    std::shared_ptr<SensorEventQueue> events;
    std::shared_ptr<AcquisitionWorker> worker;
    uint32_t generation;

    mutable std::mutex state_mutex;
    ConnectionState conn;

    ScheduledTaskId reconnect_task;
    // Identifies the scheduled attempt a RECONNECT_DUE event belongs to
    uint32_t reconnect_token;
    uint64_t retired_overflows;

    SensorEventListener* listener;
};

#endif // SENSOR_CONTROLLER_HPP
