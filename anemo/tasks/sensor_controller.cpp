#include <anemo/tasks/sensor_controller.hpp>
#include <anemo/config/config.hpp>
#include <anemo/hardware/posix_serial_port.hpp>
#include <anemo/utils/logger.hpp>
#include <anemo/utils/validators.hpp>
#include <cinttypes>
#include <cstdio>

static const char* TAG = "SENSOR_CTRL";

std::unique_ptr<SerialPort> makePosixSerialPort() {
    return std::make_unique<PosixSerialPort>();
}

SensorController::SensorController(const std::string& sensor_id,
                                   TaskScheduler& scheduler,
                                   SerialPortFactory port_factory,
                                   const NegotiationTimings& timings)
    : id(sensor_id),
      scheduler(scheduler),
      port_factory(std::move(port_factory)),
      timings(timings),
      readings(std::make_shared<ReadingBuffer>()),
      events(std::make_shared<SensorEventQueue>()),
      generation(0),
      reconnect_task(invalid_task_id),
      reconnect_token(0),
      retired_overflows(0),
      listener(nullptr) {}

SensorController::~SensorController() {
    cancelReconnect();
    stopWorker(Config::Acquisition::stop_join_timeout_ms);
}

bool SensorController::configure(const SensorLinkConfig& new_link) {
    if (worker) {
        LOG_ERROR(TAG, "%s: Cannot reconfigure while connected", id.c_str());
        return false;
    }
    if (!Validators::isValidPort(new_link.port)) {
        LOG_ERROR(TAG, "%s: Invalid port '%s'", id.c_str(), new_link.port.c_str());
        return false;
    }
    if (!Validators::isValidBaud(new_link.baud)) {
        LOG_ERROR(TAG, "%s: Invalid baud rate %u", id.c_str(), static_cast<unsigned>(new_link.baud));
        return false;
    }
    link = new_link;
    readings->clear();
    LOG_INFO(TAG, "%s: Configured %s @ %u baud with %u init commands", id.c_str(), link.port.c_str(),
             static_cast<unsigned>(link.baud), static_cast<unsigned>(link.init_commands.size()));
    return true;
}

bool SensorController::connect() {
    if (worker && worker->isRunning()) {
        LOG_WARN(TAG, "%s: Already connected", id.c_str());
        return false;
    }
    if (link.port.empty()) {
        LOG_ERROR(TAG, "%s: No port configured", id.c_str());
        return false;
    }

    LOG_INFO(TAG, "%s: Starting sensor connection", id.c_str());
    // A manual connect starts the backoff from scratch
    cancelReconnect();
    stopWorker(Config::Acquisition::reconnect_join_timeout_ms);
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        conn.last_error.clear();
        conn.protocol = NegotiatedProtocol();
    }
    return startWorker();
}

void SensorController::disconnect() {
    cancelReconnect();
    if (!worker) {
        LOG_WARN(TAG, "%s: No worker to disconnect", id.c_str());
        return;
    }

    LOG_INFO(TAG, "%s: Disconnecting sensor", id.c_str());
    stopWorker(Config::Acquisition::stop_join_timeout_ms);

    bool was_connected = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        was_connected = conn.connected;
        conn.connected = false;
    }
    if (was_connected && listener != nullptr) {
        listener->onConnectionStatus(id, false);
    }
}

std::size_t SensorController::pumpEvents(uint32_t wait_ms) {
    std::size_t handled = 0;
    SensorEvent ev;
    uint32_t wait = wait_ms;
    // Bounded so a chatty sensor cannot starve the other controllers
    while (handled < Config::Tasks::Controller::event_queue_len && events->receive(ev, wait)) {
        handleEvent(ev);
        ++handled;
        wait = 0;
    }
    if (handled < Config::Tasks::Controller::event_queue_len) {
        handled += checkWorkerExited();
    }
    return handled;
}

std::size_t SensorController::checkWorkerExited() {
    if (!worker || worker->state() != AcquisitionWorker::State::CLOSED) {
        return 0;
    }
    // A closed worker has queued everything it will ever post
    std::shared_ptr<AcquisitionWorker> exited = worker;
    std::size_t handled = 0;
    SensorEvent ev;
    while (worker == exited && handled < Config::Tasks::Controller::event_queue_len && events->receive(ev, 0)) {
        handleEvent(ev);
        ++handled;
    }
    if (worker != exited || handled == Config::Tasks::Controller::event_queue_len) {
        return handled;
    }

    LOG_WARN(TAG, "%s: Worker exited without reporting link loss", id.c_str());
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        conn.connected = false;
    }
    if (listener != nullptr) {
        listener->onConnectionStatus(id, false);
    }
    onConnectionLost();
    return handled;
}

void SensorController::handleEvent(const SensorEvent& event) {
    if (event.type == SensorEventType::RECONNECT_DUE) {
        if (event.generation != reconnect_token || reconnect_task == invalid_task_id) {
            LOG_DEBUG(TAG, "%s: Reconnection cancelled", id.c_str());
            return;
        }
        reconnect_task = invalid_task_id;
        attemptReconnect();
        return;
    }

    if (event.generation != generation) {
        // From a worker that has already been replaced or stopped
        LOG_DEBUG(TAG, "%s: Ignoring event from stale worker %u", id.c_str(), static_cast<unsigned>(event.generation));
        return;
    }

    switch (event.type) {
        case SensorEventType::STATUS: {
            {
                std::lock_guard<std::mutex> lock(state_mutex);
                conn.connected = event.connected;
                if (event.connected) {
                    conn.reconnect_attempts = 0;
                    conn.reconnect_pending = false;
                    conn.reconnect_exhausted = false;
                }
            }
            if (event.connected) {
                LOG_INFO(TAG, "%s: Connection established", id.c_str());
            } else {
                LOG_WARN(TAG, "%s: Connection lost", id.c_str());
            }
            if (listener != nullptr) {
                listener->onConnectionStatus(id, event.connected);
            }
            if (!event.connected) {
                onConnectionLost();
            }
            break;
        }
        case SensorEventType::ERROR: {
            {
                std::lock_guard<std::mutex> lock(state_mutex);
                conn.last_error = event.text;
            }
            LOG_DEBUG(TAG, "%s: Error reported: %s", id.c_str(), event.text.c_str());
            if (listener != nullptr) {
                listener->onError(id, event.text);
            }
            break;
        }
        case SensorEventType::PROGRESS: {
            {
                std::lock_guard<std::mutex> lock(state_mutex);
                conn.last_progress = event.text;
            }
            LOG_INFO(TAG, "%s: Init progress: %s", id.c_str(), event.text.c_str());
            if (listener != nullptr) {
                listener->onProgress(id, event.text);
            }
            break;
        }
        case SensorEventType::SENSOR_INFO: {
            {
                std::lock_guard<std::mutex> lock(state_mutex);
                conn.protocol = event.protocol;
            }
            if (event.protocol.isStructured()) {
                const SensorInfo& info = event.protocol.info;
                LOG_INFO(TAG, "%s: Sensor info - Model: %s, S/N: %s, FW: %s", id.c_str(),
                         info.model.c_str(), info.serial_number.c_str(), info.firmware_version.c_str());
            }
            if (listener != nullptr) {
                listener->onSensorInfo(id, event.protocol);
            }
            break;
        }
        case SensorEventType::READING:
            if (listener != nullptr) {
                listener->onReading(event.reading);
            }
            break;
        case SensorEventType::RECONNECT_DUE:
            break;
    }
}

void SensorController::onConnectionLost() {
    stopWorker(Config::Acquisition::reconnect_join_timeout_ms);
    scheduleReconnect();
}

void SensorController::scheduleReconnect() {
    int attempt = 0;
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        if (conn.reconnect_pending) {
            LOG_DEBUG(TAG, "%s: Reconnection already scheduled", id.c_str());
            return;
        }
        if (conn.reconnect_attempts >= Config::Reconnect::max_attempts) {
            conn.reconnect_exhausted = true;
            attempt = conn.reconnect_attempts;
        } else {
            attempt = conn.reconnect_attempts;
            conn.reconnect_pending = true;
            ++conn.reconnect_attempts;
        }
    }

    if (attempt >= Config::Reconnect::max_attempts) {
        LOG_ERROR(TAG, "%s: Max reconnection attempts (%d) reached. Giving up.", id.c_str(),
                  Config::Reconnect::max_attempts);
        if (listener != nullptr) {
            listener->onReconnectExhausted(id, attempt);
        }
        return;
    }

    // 1s, 2s, 4s, 8s
    uint32_t delay_ms = Config::Reconnect::base_delay_ms << attempt;
    LOG_INFO(TAG, "%s: Scheduling reconnection attempt %d/%d in %" PRIu32 "ms", id.c_str(), attempt + 1,
             Config::Reconnect::max_attempts, delay_ms);

    uint32_t token = ++reconnect_token;
    std::shared_ptr<SensorEventQueue> queue = events;
    std::string sensor = id;
    reconnect_task = scheduler.scheduleOnce(delay_ms, [queue, token, sensor]() {
        SensorEvent due;
        due.type = SensorEventType::RECONNECT_DUE;
        due.generation = token;
        if (!queue->send(due, Config::Tasks::Controller::event_post_timeout_ms)) {
            LOG_WARN(TAG, "%s: Event queue full, reconnect trigger lost", sensor.c_str());
        }
    });
    if (reconnect_task == invalid_task_id) {
        LOG_ERROR(TAG, "%s: Failed to schedule reconnection", id.c_str());
        std::lock_guard<std::mutex> lock(state_mutex);
        conn.reconnect_pending = false;
    }
}

void SensorController::attemptReconnect() {
    int attempt = 0;
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        conn.reconnect_pending = false;
        attempt = conn.reconnect_attempts;
    }
    LOG_INFO(TAG, "%s: Attempting reconnection (attempt %d/%d)", id.c_str(), attempt,
             Config::Reconnect::max_attempts);

    stopWorker(Config::Acquisition::reconnect_join_timeout_ms);
    if (!startWorker()) {
        // A connection-lost event from the next worker drives any further retry
        LOG_WARN(TAG, "%s: Reconnection attempt failed", id.c_str());
    }
}

void SensorController::cancelReconnect() {
    if (reconnect_task != invalid_task_id) {
        LOG_INFO(TAG, "%s: Cancelling reconnection", id.c_str());
        (void)scheduler.cancel(reconnect_task);
        reconnect_task = invalid_task_id;
    }
    // Invalidates a trigger that already reached the queue
    ++reconnect_token;

    std::lock_guard<std::mutex> lock(state_mutex);
    conn.reconnect_pending = false;
    conn.reconnect_attempts = 0;
    conn.reconnect_exhausted = false;
}

bool SensorController::startWorker() {
    std::unique_ptr<SerialPort> port = port_factory ? port_factory() : std::unique_ptr<SerialPort>();
    if (!port) {
        LOG_ERROR(TAG, "%s: No serial port available", id.c_str());
        return false;
    }

    ++generation;
    std::shared_ptr<AcquisitionWorker> fresh =
        std::make_shared<AcquisitionWorker>(id, link, std::move(port), readings, events, generation, timings);
    if (!fresh->start()) {
        LOG_ERROR(TAG, "%s: Failed to start worker", id.c_str());
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        worker = fresh;
    }
    LOG_INFO(TAG, "%s: Worker thread started", id.c_str());
    return true;
}

void SensorController::stopWorker(uint32_t join_timeout_ms) {
    std::shared_ptr<AcquisitionWorker> old;
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        old = worker;
    }
    if (!old) {
        return;
    }

    old->requestStop();
    if (!old->join(join_timeout_ms)) {
        LOG_ERROR(TAG, "%s: Worker thread did not stop within timeout", id.c_str());
    } else {
        LOG_INFO(TAG, "%s: Worker thread stopped", id.c_str());
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex);
        retired_overflows += old->overflowCount();
        worker.reset();
    }
    // Anything the old worker still has queued is now stale
    ++generation;
}

bool SensorController::sendCommand(const std::string& command) {
    if (!worker) {
        LOG_ERROR(TAG, "%s: Cannot send command - not connected", id.c_str());
        return false;
    }
    return worker->sendCommand(command);
}

bool SensorController::setOutputRate(int rate_hz) {
    if (!Validators::isValidOutputRate(rate_hz)) {
        LOG_ERROR(TAG, "%s: Invalid output rate %d Hz (allowed %d-%d)", id.c_str(), rate_hz,
                  Config::Output::min_rate_hz, Config::Output::max_rate_hz);
        return false;
    }
    if (!worker || !isConnected()) {
        LOG_WARN(TAG, "%s: Cannot set output rate - not connected", id.c_str());
        return false;
    }

    ProtocolKind kind;
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        kind = conn.protocol.kind;
    }
    if (kind != ProtocolKind::STRUCTURED) {
        LOG_DEBUG(TAG, "%s: Skipping output rate change (protocol: %s)", id.c_str(), protocolKindName(kind));
        return false;
    }

    char command[32];
    std::snprintf(command, sizeof(command), "{outputrate %d}", rate_hz);
    bool ok = worker->sendCommand(command);
    if (ok) {
        LOG_INFO(TAG, "%s: Output rate set to %d Hz", id.c_str(), rate_hz);
    }
    return ok;
}

ConnectionState SensorController::state() const {
    std::lock_guard<std::mutex> lock(state_mutex);
    return conn;
}

bool SensorController::isConnected() const {
    std::lock_guard<std::mutex> lock(state_mutex);
    return conn.connected;
}

void SensorController::clearBuffer() {
    readings->clear();
    LOG_INFO(TAG, "%s: Buffer cleared", id.c_str());
}

uint64_t SensorController::overflowCount() const {
    std::lock_guard<std::mutex> lock(state_mutex);
    return retired_overflows + (worker ? worker->overflowCount() : 0);
}
