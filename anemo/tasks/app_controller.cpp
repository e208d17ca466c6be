#include <anemo/tasks/app_controller.hpp>
#include <anemo/config/config.hpp>
#include <anemo/tasks/command_task.hpp>
#include <anemo/utils/logger.hpp>
#include <anemo/utils/time_format.hpp>
#include <anemo/utils/validators.hpp>
#include <inttypes.h>

static const char* TAG = "APP_CTRL";

namespace {
    static ExportResult rejected(const std::string& message) {
        ExportResult r;
        r.success = false;
        r.message = message;
        return r;
    }

    static std::string joinTags(const std::vector<std::string>& tags) {
        std::string joined;
        for (std::size_t i = 0; i < tags.size(); ++i) {
            if (i > 0) {
                joined += ", ";
            }
            joined += tags[i];
        }
        return joined;
    }
}

AppController::AppController(TaskScheduler& scheduler,
                             SerialPortFactory port_factory,
                             const NegotiationTimings& timings,
                             std::FILE* out)
    : out(out) {
    for (const char* id : Config::Sensors::default_ids) {
        std::unique_ptr<SensorController> controller =
            std::make_unique<SensorController>(id, scheduler, port_factory, timings);
        controller->setListener(this);
        controllers.push_back(std::move(controller));
        LOG_DEBUG(TAG, "Created controller for %s", id);
    }
    LOG_INFO(TAG, "Initialized with %u sensor slots", static_cast<unsigned>(controllers.size()));
}

AppController::~AppController() {
    for (std::unique_ptr<SensorController>& controller : controllers) {
        controller->setListener(nullptr);
    }
}

SensorController* AppController::sensor(const std::string& sensor_id) {
    for (std::unique_ptr<SensorController>& controller : controllers) {
        if (controller->sensorId() == sensor_id) {
            return controller.get();
        }
    }
    return nullptr;
}

const SensorController* AppController::sensor(const std::string& sensor_id) const {
    for (const std::unique_ptr<SensorController>& controller : controllers) {
        if (controller->sensorId() == sensor_id) {
            return controller.get();
        }
    }
    return nullptr;
}

SensorController* AppController::requireSensor(const std::string& sensor_id) {
    SensorController* controller = sensor(sensor_id);
    if (controller == nullptr) {
        LOG_ERROR(TAG, "Unknown sensor ID: %s", sensor_id.c_str());
        std::fprintf(out, "Unknown sensor ID: %s\n", sensor_id.c_str());
    }
    return controller;
}

bool AppController::configureSensor(const std::string& sensor_id, const SensorLinkConfig& link) {
    SensorController* controller = requireSensor(sensor_id);
    if (controller == nullptr) {
        return false;
    }
    return controller->configure(link);
}

bool AppController::connectSensor(const std::string& sensor_id) {
    SensorController* controller = requireSensor(sensor_id);
    if (controller == nullptr) {
        return false;
    }
    const SensorLinkConfig& link = controller->linkConfig();
    LOG_INFO(TAG, "Connecting %s to %s @ %u baud with %u init commands", sensor_id.c_str(), link.port.c_str(),
             static_cast<unsigned>(link.baud), static_cast<unsigned>(link.init_commands.size()));

    bool ok = controller->connect();
    if (ok) {
        LOG_INFO(TAG, "%s: Connection initiated successfully", sensor_id.c_str());
    } else {
        LOG_WARN(TAG, "%s: Failed to initiate connection", sensor_id.c_str());
    }
    return ok;
}

bool AppController::disconnectSensor(const std::string& sensor_id) {
    SensorController* controller = requireSensor(sensor_id);
    if (controller == nullptr) {
        return false;
    }
    LOG_INFO(TAG, "Disconnecting %s", sensor_id.c_str());
    controller->disconnect();
    return true;
}

void AppController::disconnectAll() {
    LOG_INFO(TAG, "%s", "Disconnecting all sensors...");
    for (std::unique_ptr<SensorController>& controller : controllers) {
        if (controller->isConnected() || controller->hasWorker()) {
            LOG_INFO(TAG, "Disconnecting %s...", controller->sensorId().c_str());
            controller->disconnect();
        }
    }
    LOG_INFO(TAG, "%s", "All sensors disconnected");
}

std::vector<std::string> AppController::allSensorIds() const {
    std::vector<std::string> ids;
    for (const std::unique_ptr<SensorController>& controller : controllers) {
        ids.push_back(controller->sensorId());
    }
    return ids;
}

std::vector<std::string> AppController::connectedSensorIds() const {
    std::vector<std::string> ids;
    for (const std::unique_ptr<SensorController>& controller : controllers) {
        if (controller->isConnected()) {
            ids.push_back(controller->sensorId());
        }
    }
    return ids;
}

std::size_t AppController::pumpAll() {
    std::size_t handled = 0;
    for (std::unique_ptr<SensorController>& controller : controllers) {
        handled += controller->pumpEvents(0);
    }
    return handled;
}

ExportResult AppController::exportSingle(const std::string& sensor_id, const std::string& path) {
    const SensorController* controller = sensor(sensor_id);
    if (controller == nullptr) {
        LOG_ERROR(TAG, "Unknown sensor ID: %s", sensor_id.c_str());
        return rejected("Unknown sensor ID: " + sensor_id);
    }

    std::string reason;
    if (!Validators::validateCsvPath(path, reason)) {
        LOG_ERROR(TAG, "Invalid filepath: %s", reason.c_str());
        return rejected(reason);
    }

    std::vector<Reading> readings = controller->buffer().snapshot();
    if (readings.empty()) {
        std::string message = "No data available for " + sensor_id;
        LOG_WARN(TAG, "%s", message.c_str());
        return rejected(message);
    }

    LOG_INFO(TAG, "Exporting %u records from %s to %s", static_cast<unsigned>(readings.size()), sensor_id.c_str(),
             path.c_str());
    ExportResult result = CsvExporter::writeSingleSensor(path, readings);
    if (result.success) {
        LOG_INFO(TAG, "Successfully exported %s data: %s", sensor_id.c_str(), result.message.c_str());
    } else {
        LOG_ERROR(TAG, "Failed to export %s data: %s", sensor_id.c_str(), result.message.c_str());
    }
    return result;
}

ExportResult AppController::exportMulti(const std::string& path) {
    return exportMulti(path, allSensorIds());
}

ExportResult AppController::exportMulti(const std::string& path, const std::vector<std::string>& sensor_ids) {
    std::string reason;
    if (!Validators::validateCsvPath(path, reason)) {
        LOG_ERROR(TAG, "Invalid filepath: %s", reason.c_str());
        return rejected(reason);
    }

    for (const std::string& id : sensor_ids) {
        if (sensor(id) == nullptr) {
            LOG_ERROR(TAG, "Unknown sensor ID: %s", id.c_str());
            return rejected("Unknown sensor ID: " + id);
        }
    }
    if (sensor_ids.empty()) {
        LOG_ERROR(TAG, "%s", "No sensors specified for export");
        return rejected("No sensors specified for export");
    }

    SensorSeries series;
    std::size_t total = 0;
    for (const std::string& id : sensor_ids) {
        std::vector<Reading> readings = sensor(id)->buffer().snapshot();
        if (readings.empty()) {
            LOG_WARN(TAG, "%s: No data available", id.c_str());
            continue;
        }
        LOG_DEBUG(TAG, "%s: %u records collected", id.c_str(), static_cast<unsigned>(readings.size()));
        total += readings.size();
        series[id].swap(readings);
    }

    if (series.empty()) {
        LOG_WARN(TAG, "%s", "No data available from any selected sensor");
        return rejected("No data available from any selected sensor");
    }

    LOG_INFO(TAG, "Exporting %u total records from %u sensors to %s", static_cast<unsigned>(total),
             static_cast<unsigned>(series.size()), path.c_str());
    ExportResult result = CsvExporter::writeMultiSensor(path, series);
    if (result.success) {
        LOG_INFO(TAG, "Successfully exported multi-sensor data: %s", result.message.c_str());
    } else {
        LOG_ERROR(TAG, "Failed to export multi-sensor data: %s", result.message.c_str());
    }
    return result;
}

std::size_t AppController::setOutputRateAll(int rate_hz) {
    if (!Validators::isValidOutputRate(rate_hz)) {
        LOG_ERROR(TAG, "Invalid output rate %d Hz (allowed %d-%d)", rate_hz, Config::Output::min_rate_hz,
                  Config::Output::max_rate_hz);
        return 0;
    }
    std::size_t applied = 0;
    for (std::unique_ptr<SensorController>& controller : controllers) {
        if (controller->isConnected() && controller->setOutputRate(rate_hz)) {
            ++applied;
        }
    }
    LOG_INFO(TAG, "Output rate %d Hz applied to %u sensors", rate_hz, static_cast<unsigned>(applied));
    return applied;
}

bool AppController::handleCommand(const Command& cmd) {
    switch (cmd.type) {
        case CommandType::HELP:
            CommandTask::printHelp(out);
            break;

        case CommandType::CONNECT:
            if (cmd.sensor_id.empty()) {
                for (std::unique_ptr<SensorController>& controller : controllers) {
                    if (!controller->linkConfig().port.empty() && !controller->hasWorker()) {
                        (void)connectSensor(controller->sensorId());
                    }
                }
            } else if (connectSensor(cmd.sensor_id)) {
                std::fprintf(out, "%s: connecting\n", cmd.sensor_id.c_str());
            } else {
                std::fprintf(out, "%s: connect failed\n", cmd.sensor_id.c_str());
            }
            break;

        case CommandType::DISCONNECT:
            if (cmd.sensor_id.empty()) {
                disconnectAll();
            } else {
                (void)disconnectSensor(cmd.sensor_id);
            }
            break;

        case CommandType::STATUS:
            printStatus();
            break;

        case CommandType::INFO: {
            SensorController* controller = requireSensor(cmd.sensor_id);
            if (controller != nullptr) {
                printInfo(*controller);
            }
            break;
        }

        case CommandType::LATEST: {
            SensorController* controller = requireSensor(cmd.sensor_id);
            if (controller != nullptr) {
                printLatest(*controller);
            }
            break;
        }

        case CommandType::CLEAR:
            if (cmd.sensor_id.empty()) {
                for (std::unique_ptr<SensorController>& controller : controllers) {
                    controller->clearBuffer();
                }
            } else {
                SensorController* controller = requireSensor(cmd.sensor_id);
                if (controller != nullptr) {
                    controller->clearBuffer();
                }
            }
            break;

        case CommandType::SET_RATE:
            if (cmd.sensor_id.empty()) {
                std::size_t applied = setOutputRateAll(cmd.value);
                std::fprintf(out, "Output rate %d Hz sent to %u sensors\n", static_cast<int>(cmd.value),
                             static_cast<unsigned>(applied));
            } else {
                SensorController* controller = requireSensor(cmd.sensor_id);
                if (controller != nullptr) {
                    bool ok = controller->setOutputRate(cmd.value);
                    std::fprintf(out, "%s: output rate %d Hz %s\n", cmd.sensor_id.c_str(),
                                 static_cast<int>(cmd.value), ok ? "sent" : "not sent");
                }
            }
            break;

        case CommandType::SEND_RAW: {
            SensorController* controller = requireSensor(cmd.sensor_id);
            if (controller != nullptr) {
                bool ok = controller->sendCommand(cmd.text);
                std::fprintf(out, "%s: '%s' %s\n", cmd.sensor_id.c_str(), cmd.text.c_str(), ok ? "sent" : "not sent");
            }
            break;
        }

        case CommandType::EXPORT_SINGLE:
            printResult(exportSingle(cmd.sensor_id, cmd.text));
            break;

        case CommandType::EXPORT_MULTI:
            if (cmd.sensor_ids.empty()) {
                printResult(exportMulti(cmd.text));
            } else {
                printResult(exportMulti(cmd.text, cmd.sensor_ids));
            }
            break;

        case CommandType::QUIT:
            LOG_INFO(TAG, "%s", "Quit requested");
            return false;

        default:
            LOG_WARN(TAG, "Unknown command type: %" PRId32, static_cast<int32_t>(cmd.type));
            break;
    }
    std::fflush(out);
    return true;
}

void AppController::printStatus() {
    for (std::unique_ptr<SensorController>& controller : controllers) {
        const SensorLinkConfig& link = controller->linkConfig();
        ConnectionState st = controller->state();

        const char* link_state = st.connected ? "connected" : "disconnected";
        if (!st.connected && st.reconnect_pending) {
            link_state = "reconnecting";
        } else if (!st.connected && controller->hasWorker()) {
            link_state = "connecting";
        }

        if (link.port.empty()) {
            std::fprintf(out, "%-8s (not configured)\n", controller->sensorId().c_str());
            continue;
        }
        std::fprintf(out, "%-8s %s@%u %-12s protocol=%s readings=%u overflows=%" PRIu64 "\n",
                     controller->sensorId().c_str(), link.port.c_str(), static_cast<unsigned>(link.baud), link_state,
                     protocolKindName(st.protocol.kind), static_cast<unsigned>(controller->buffer().size()),
                     controller->overflowCount());
        if (st.reconnect_attempts > 0 || st.reconnect_exhausted) {
            std::fprintf(out, "         reconnect attempts %d/%d%s\n", st.reconnect_attempts,
                         Config::Reconnect::max_attempts, st.reconnect_exhausted ? " (gave up)" : "");
        }
        if (!st.last_error.empty()) {
            std::fprintf(out, "         last error: %s\n", st.last_error.c_str());
        }
    }
}

void AppController::printInfo(const SensorController& controller) {
    ConnectionState st = controller.state();
    std::fprintf(out, "%s: protocol %s\n", controller.sensorId().c_str(), protocolKindName(st.protocol.kind));
    if (!st.protocol.isStructured()) {
        return;
    }
    const SensorInfo& info = st.protocol.info;
    std::fprintf(out, "  Model:    %s\n", info.model.empty() ? "Unknown" : info.model.c_str());
    std::fprintf(out, "  S/N:      %s\n", info.serial_number.c_str());
    std::fprintf(out, "  Firmware: %s\n", info.firmware_version.c_str());
    std::fprintf(out, "  Rate:     %s Hz\n", info.sample_rate.c_str());
    std::fprintf(out, "  Output:   %s\n", joinTags(info.enabled_tags).c_str());
    if (!info.raw_version.empty()) {
        std::fprintf(out, "  Version response: %s\n", info.raw_version.c_str());
    }
    if (!info.raw_settings.empty()) {
        std::fprintf(out, "  Settings response: %s\n", info.raw_settings.c_str());
    }
}

void AppController::printLatest(const SensorController& controller) {
    Reading r;
    if (!controller.buffer().latest(r)) {
        std::fprintf(out, "%s: no readings\n", controller.sensorId().c_str());
        return;
    }
    char ts[TimeFormat::timestamp_len + 1];
    if (!TimeFormat::formatTimestampMs(r.timestampMs(), ts, sizeof(ts))) {
        ts[0] = '\0';
    }
    std::fprintf(out, "%s %s S=%.2f D=%.2f U=%.2f V=%.2f W=%.2f T=%.2f PI=%.2f RO=%.2f%s\n",
                 r.sensorId(), ts, r.speed2d(), r.direction(), r.uComponent(), r.vComponent(), r.wComponent(),
                 r.temperature(), r.pitch(), r.roll(), r.isValid() ? "" : " (sensor error)");
}

void AppController::printResult(const ExportResult& result) {
    std::fprintf(out, "%s: %s\n", result.success ? "Export complete" : "Export failed", result.message.c_str());
}

void AppController::onConnectionStatus(const std::string& sensor_id, bool connected) {
    std::fprintf(out, "[%s] %s\n", sensor_id.c_str(), connected ? "Connected" : "Disconnected");
    std::fflush(out);
}

void AppController::onError(const std::string& sensor_id, const std::string& message) {
    std::fprintf(out, "[%s] Error: %s\n", sensor_id.c_str(), message.c_str());
    std::fflush(out);
}

void AppController::onProgress(const std::string& sensor_id, const std::string& step) {
    std::fprintf(out, "[%s] %s\n", sensor_id.c_str(), step.c_str());
    std::fflush(out);
}

void AppController::onSensorInfo(const std::string& sensor_id, const NegotiatedProtocol& protocol) {
    std::fprintf(out, "[%s] Protocol: %s\n", sensor_id.c_str(), protocolKindName(protocol.kind));
    std::fflush(out);
}

void AppController::onReconnectExhausted(const std::string& sensor_id, int attempts) {
    std::fprintf(out, "[%s] Reconnection failed after %d attempts; use 'connect %s' to retry\n", sensor_id.c_str(),
                 attempts, sensor_id.c_str());
    std::fflush(out);
}
