#include <anemo/tasks/acquisition_worker.hpp>
#include <anemo/config/config.hpp>
#include <anemo/protocol/line_parser.hpp>
#include <anemo/protocol/response_reader.hpp>
#include <anemo/utils/logger.hpp>
#include <anemo/utils/time_format.hpp>
#include <chrono>
#include <cinttypes>
#include <system_error>

static const char* TAG = "ACQ_WORKER";

namespace {
    static std::string trim(const std::string& s) {
        const char* ws = " \t\r\n";
        std::size_t b = s.find_first_not_of(ws);
        if (b == std::string::npos) {
            return std::string();
        }
        std::size_t e = s.find_last_not_of(ws);
        return s.substr(b, e - b + 1);
    }
}

AcquisitionWorker::AcquisitionWorker(const std::string& sensor_id,
                                     const SensorLinkConfig& link,
                                     std::unique_ptr<SerialPort> port,
                                     std::shared_ptr<ReadingBuffer> buffer,
                                     std::shared_ptr<SensorEventQueue> events,
                                     uint32_t generation,
                                     const NegotiationTimings& timings)
    : sensor_id(sensor_id),
      link(link),
      port(std::move(port)),
      buffer(std::move(buffer)),
      events(std::move(events)),
      worker_generation(generation),
      timings(timings),
      current_state(State::IDLE),
      stop_requested(false),
      overflow_count(0),
      reading_count(0),
      port_open(false),
      started(false),
      finished(false) {
    LOG_INFO(TAG, "Worker created for %s on %s @ %u baud", sensor_id.c_str(), link.port.c_str(),
             static_cast<unsigned>(link.baud));
}

AcquisitionWorker::~AcquisitionWorker() {
    if (thread.joinable()) {
        // Last reference released by the worker thread itself
        if (thread.get_id() == std::this_thread::get_id()) {
            thread.detach();
        } else {
            stop_requested = true;
            thread.join();
        }
    }
}

const char* AcquisitionWorker::stateName(State state) {
    switch (state) {
        case State::IDLE:        return "idle";
        case State::OPENING:     return "opening";
        case State::NEGOTIATING: return "negotiating";
        case State::READING:     return "reading";
        case State::STOPPING:    return "stopping";
        case State::CLOSED:      return "closed";
    }
    return "unknown";
}

bool AcquisitionWorker::start() {
    std::lock_guard<std::mutex> lock(finish_mutex);
    if (started) {
        LOG_WARN(TAG, "%s: Worker already started", sensor_id.c_str());
        return false;
    }
    if (!port || !buffer || !events) {
        LOG_ERROR(TAG, "%s: Worker is missing its port, buffer or queue", sensor_id.c_str());
        return false;
    }
    std::shared_ptr<AcquisitionWorker> self = shared_from_this();
    try {
        thread = std::thread([self]() { self->run(); });
    } catch (const std::system_error& e) {
        LOG_ERROR(TAG, "%s: Failed to create worker thread: %s", sensor_id.c_str(), e.what());
        return false;
    }
    started = true;
    return true;
}

void AcquisitionWorker::requestStop() {
    if (!stop_requested.exchange(true)) {
        LOG_INFO(TAG, "%s: Stop requested", sensor_id.c_str());
    }
}

bool AcquisitionWorker::join(uint32_t timeout_ms) {
    std::unique_lock<std::mutex> lock(finish_mutex);
    if (!started) {
        return true;
    }
    bool done = finished_cv.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] { return finished; });
    lock.unlock();

    if (!thread.joinable()) {
        return done;
    }
    if (done) {
        thread.join();
        return true;
    }
    LOG_WARN(TAG, "%s: Worker did not stop within %u ms, detaching", sensor_id.c_str(),
             static_cast<unsigned>(timeout_ms));
    thread.detach();
    return false;
}

bool AcquisitionWorker::isRunning() const {
    State s = current_state.load();
    return s != State::IDLE && s != State::CLOSED;
}

bool AcquisitionWorker::sendCommand(const std::string& command) {
    std::lock_guard<std::mutex> lock(port_mutex);
    if (!port_open) {
        LOG_ERROR(TAG, "%s: Cannot send command - port not open", sensor_id.c_str());
        return false;
    }
    LOG_INFO(TAG, "%s: Sending command: %s", sensor_id.c_str(), command.c_str());
    if (!ResponseReader::writePaced(*port, command, timings.inter_byte_delay_ms)) {
        LOG_ERROR(TAG, "%s: Failed to send command: %s", sensor_id.c_str(), port->lastError().c_str());
        return false;
    }
    // Give the device time to act on it
    std::this_thread::sleep_for(std::chrono::milliseconds(Config::Serial::post_command_delay_ms));
    LOG_INFO(TAG, "%s: Command sent successfully", sensor_id.c_str());
    return true;
}

void AcquisitionWorker::run() {
    current_state = State::OPENING;
    LOG_INFO(TAG, "%s: Opening serial port %s", sensor_id.c_str(), link.port.c_str());
    if (!openPort()) {
        std::string msg = std::string("Serial port error: ") + port->lastError();
        LOG_ERROR(TAG, "%s: %s", sensor_id.c_str(), msg.c_str());
        postError(msg);
        postStatus(false);
        current_state = State::CLOSED;
        finish();
        return;
    }
    postStatus(true);
    LOG_INFO(TAG, "%s: Serial port opened successfully", sensor_id.c_str());

    current_state = State::NEGOTIATING;
    ProtocolNegotiator negotiator(*port, sensor_id, stop_requested, this, timings);
    NegotiatedProtocol protocol;
    NegotiationStatus st = negotiator.negotiate(link.init_commands, protocol);

    switch (st) {
        case NegotiationStatus::STRUCTURED:
        case NegotiationStatus::LEGACY:
        case NegotiationStatus::NONE: {
            LOG_INFO(TAG, "%s: Negotiated protocol: %s", sensor_id.c_str(), protocolKindName(protocol.kind));
            SensorEvent ev;
            ev.type = SensorEventType::SENSOR_INFO;
            ev.protocol = protocol;
            post(ev, false);
            readLoop();
            break;
        }
        case NegotiationStatus::IO_ERROR:
            postError(std::string("Serial error during initialization: ") + port->lastError());
            postStatus(false);
            break;
        case NegotiationStatus::STOPPED:
            break;
    }

    current_state = State::STOPPING;
    closePort();
    current_state = State::CLOSED;
    finish();
}

bool AcquisitionWorker::openPort() {
    std::lock_guard<std::mutex> lock(port_mutex);
    if (!port->open(link.port, link.baud)) {
        return false;
    }
    // Start from empty buffers in both directions
    if (!port->flushInput() || !port->flushOutput()) {
        port->close();
        return false;
    }
    port_open = true;
    return true;
}

void AcquisitionWorker::readLoop() {
    LOG_INFO(TAG, "%s: Entering data read loop", sensor_id.c_str());
    current_state = State::READING;

    std::string line;
    ParsedFields fields;

    while (!stop_requested.load()) {
        long pending = port->bytesAvailable();
        if (pending < 0) {
            LOG_ERROR(TAG, "%s: Serial error reading data: %s", sensor_id.c_str(), port->lastError().c_str());
            postError(std::string("Serial error reading data: ") + port->lastError());
            postStatus(false);
            break;
        }
        if (static_cast<std::size_t>(pending) > Config::Acquisition::overflow_threshold_bytes) {
            uint64_t overflows = ++overflow_count;
            LOG_WARN(TAG, "%s: Input buffer overflow detected (%ld bytes). Flushing buffer. Overflow count: %" PRIu64,
                     sensor_id.c_str(), pending, overflows);
            if (!port->flushInput()) {
                LOG_ERROR(TAG, "%s: Serial error flushing input: %s", sensor_id.c_str(), port->lastError().c_str());
                postError(std::string("Serial error reading data: ") + port->lastError());
                postStatus(false);
                break;
            }
            continue;
        }

        ReadStatus rs = port->readLine(line, Config::Serial::read_timeout_ms);
        if (rs == ReadStatus::ERROR) {
            LOG_ERROR(TAG, "%s: Serial error reading data: %s", sensor_id.c_str(), port->lastError().c_str());
            postError(std::string("Serial error reading data: ") + port->lastError());
            postStatus(false);
            break;
        }
        if (rs == ReadStatus::TIMEOUT) {
            if (!line.empty()) {
                LOG_DEBUG(TAG, "%s: Incomplete line received, discarding: %.50s", sensor_id.c_str(), line.c_str());
            }
            continue;
        }

        line = trim(line);
        if (line.empty()) {
            continue;
        }
        LOG_DEBUG(TAG, "%s: Received: %s", sensor_id.c_str(), line.c_str());

        LineParser::ParseStatus ps = LineParser::parseLine(line.c_str(), fields);
        if (ps != LineParser::ParseStatus::OK) {
            LOG_WARN(TAG, "%s: Parse error: %s. Line: %s", sensor_id.c_str(), LineParser::statusName(ps), line.c_str());
            continue;
        }
        const char* missing = LineParser::firstMissingTag(fields);
        if (missing != nullptr) {
            LOG_WARN(TAG, "%s: Incomplete data (missing required tag %s), skipping", sensor_id.c_str(), missing);
            continue;
        }

        Reading reading;
        if (!Reading::fromFields(sensor_id.c_str(), fields, TimeFormat::nowEpochMs(), reading)) {
            LOG_WARN(TAG, "%s: Could not build reading from line: %s", sensor_id.c_str(), line.c_str());
            continue;
        }
        if (!reading.isValid()) {
            LOG_DEBUG(TAG, "%s: Data contains error codes (-99.9/-99.99)", sensor_id.c_str());
        }

        (void)buffer->append(reading);
        ++reading_count;

        SensorEvent ev;
        ev.type = SensorEventType::READING;
        ev.reading = reading;
        post(ev, true);
    }

    LOG_INFO(TAG, "%s: Read loop exited. Buffer overflows: %" PRIu64, sensor_id.c_str(), overflow_count.load());
}

void AcquisitionWorker::closePort() {
    std::lock_guard<std::mutex> lock(port_mutex);
    if (!port_open) {
        return;
    }
    port_open = false;
    port->close();
    LOG_INFO(TAG, "%s: Serial port closed", sensor_id.c_str());
}

void AcquisitionWorker::finish() {
    {
        std::lock_guard<std::mutex> lock(finish_mutex);
        finished = true;
    }
    finished_cv.notify_all();
}

void AcquisitionWorker::onProgress(const std::string& text) {
    SensorEvent ev;
    ev.type = SensorEventType::PROGRESS;
    ev.text = text;
    post(ev, false);
}

void AcquisitionWorker::onError(const std::string& text) {
    postError(text);
}

void AcquisitionWorker::postStatus(bool connected) {
    SensorEvent ev;
    ev.type = SensorEventType::STATUS;
    ev.connected = connected;
    if (connected) {
        post(ev, false);
        return;
    }
    // Link loss must reach the controller; keep trying until it drains the queue
    ev.generation = worker_generation;
    while (!events->send(ev, Config::Tasks::Controller::event_post_timeout_ms)) {
        if (stop_requested.load()) {
            LOG_DEBUG(TAG, "%s: Stopped before link loss could be queued", sensor_id.c_str());
            return;
        }
        LOG_WARN(TAG, "%s: Event queue full, retrying link loss event", sensor_id.c_str());
    }
}

void AcquisitionWorker::postError(const std::string& text) {
    SensorEvent ev;
    ev.type = SensorEventType::ERROR;
    ev.text = text;
    post(ev, false);
}

void AcquisitionWorker::post(SensorEvent& event, bool droppable) {
    event.generation = worker_generation;
    bool sent = droppable
        ? events->send(event, 0, Config::Tasks::Controller::event_reserved_slots)
        : events->send(event, Config::Tasks::Controller::event_post_timeout_ms);
    if (!sent && !droppable) {
        LOG_WARN(TAG, "%s: Event queue full, dropping event type %d", sensor_id.c_str(), static_cast<int>(event.type));
    }
}
