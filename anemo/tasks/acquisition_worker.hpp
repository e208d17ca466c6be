#ifndef ACQUISITION_WORKER_HPP
#define ACQUISITION_WORKER_HPP

#include <anemo/hardware/serial_port.hpp>
#include <anemo/models/sensor_event.hpp>
#include <anemo/models/sensor_link_config.hpp>
#include <anemo/protocol/protocol_negotiator.hpp>
#include <anemo/state/reading_buffer.hpp>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

// One serial connection on its own thread: open, negotiate, then read lines
// until stopped or the link fails. Readings go straight into the buffer; status,
// errors, progress and negotiation results are posted to the controller's queue
// tagged with this worker's generation.
//
// Must be owned by a std::shared_ptr; the thread keeps the worker alive, so a
// worker that misses its join timeout can be released safely.
class AcquisitionWorker : public std::enable_shared_from_this<AcquisitionWorker>,
                          private NegotiationListener {
public:
    enum class State : uint8_t {
        IDLE = 0,
        OPENING = 1,
        NEGOTIATING = 2,
        READING = 3,
        STOPPING = 4,
        CLOSED = 5,
    };

    AcquisitionWorker(const std::string& sensor_id,
                      const SensorLinkConfig& link,
                      std::unique_ptr<SerialPort> port,
                      std::shared_ptr<ReadingBuffer> buffer,
                      std::shared_ptr<SensorEventQueue> events,
                      uint32_t generation,
                      const NegotiationTimings& timings = NegotiationTimings::defaults());
    ~AcquisitionWorker() override;

    AcquisitionWorker(const AcquisitionWorker&) = delete;
    AcquisitionWorker& operator=(const AcquisitionWorker&) = delete;

    bool start();
    void requestStop();

    // Waits for the thread to finish. On timeout the thread is detached and
    // left to exit by itself; returns false.
    bool join(uint32_t timeout_ms);

    // Paced write of a command while the port is open. Safe from any thread.
    bool sendCommand(const std::string& command);

    State state() const { return current_state.load(); }
    bool isRunning() const;
    uint32_t generation() const { return worker_generation; }
    uint64_t overflowCount() const { return overflow_count.load(); }
    uint64_t readingCount() const { return reading_count.load(); }

    static const char* stateName(State state);

private:
    void run();
    bool openPort();
    void readLoop();
    void closePort();
    void finish();

    void onProgress(const std::string& text) override;
    void onError(const std::string& text) override;

    void postStatus(bool connected);
    void postError(const std::string& text);
    void post(SensorEvent& event, bool droppable);

    std::string sensor_id;
    SensorLinkConfig link;
    std::unique_ptr<SerialPort> port;
    std::shared_ptr<ReadingBuffer> buffer;
    std::shared_ptr<SensorEventQueue> events;
    uint32_t worker_generation;
    NegotiationTimings timings;

    std::atomic<State> current_state;
    std::atomic<bool> stop_requested;
    std::atomic<uint64_t> overflow_count;
    std::atomic<uint64_t> reading_count;

    // Serializes open/close against writes from other threads
    mutable std::mutex port_mutex;
    bool port_open;

    std::mutex finish_mutex;
    std::condition_variable finished_cv;
    bool started;
    bool finished;
    std::thread thread;
};

#endif // ACQUISITION_WORKER_HPP
