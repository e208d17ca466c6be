#include <anemo/protocol/protocol_negotiator.hpp>
#include <anemo/protocol/line_parser.hpp>
#include <anemo/protocol/response_reader.hpp>
#include <anemo/config/config.hpp>
#include <anemo/utils/logger.hpp>
#include <mjson.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <thread>

static const char* TAG = "NEGOTIATOR";

namespace {
    typedef std::chrono::steady_clock Clock;

    // {settings} Output entry name -> telemetry tag
    struct OutputTagMapping {
        const char* name;
        const char* tag;
    };

    static constexpr OutputTagMapping output_tag_map[] = {
        { "Wind Speed",         LineParser::TAG_SPEED },
        { "Wind Direction",     LineParser::TAG_DIRECTION },
        { "Vertical Direction", LineParser::TAG_VERT_DIR },
        { "U",                  LineParser::TAG_U },
        { "V",                  LineParser::TAG_V },
        { "W",                  LineParser::TAG_W },
        { "Sonic Temperature",  LineParser::TAG_TEMP },
        { "Pitch",              LineParser::TAG_PITCH },
        { "Roll",               LineParser::TAG_ROLL },
        { "Status",             "ST" },
    };

    static std::string trim(const std::string& s) {
        const char* ws = " \t\r\n";
        std::size_t b = s.find_first_not_of(ws);
        if (b == std::string::npos) {
            return std::string();
        }
        std::size_t e = s.find_last_not_of(ws);
        return s.substr(b, e - b + 1);
    }

    static std::string afterColon(const std::string& line) {
        std::size_t colon = line.find(':');
        return colon == std::string::npos ? std::string() : trim(line.substr(colon + 1));
    }

    static bool containsNoCase(const std::string& haystack, const char* needle) {
        std::string lower(haystack);
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lower.find(needle) != std::string::npos;
    }

    static bool getString(const std::string& json, const char* path, std::string& out) {
        char buf[128];
        int n = mjson_get_string(json.c_str(), static_cast<int>(json.size()), path, buf, sizeof(buf));
        if (n < 0) {
            return false;
        }
        out.assign(buf, static_cast<std::size_t>(n));
        return true;
    }

    // String or number member, as text
    static bool getScalarText(const std::string& json, const char* path, std::string& out) {
        if (getString(json, path, out)) {
            return true;
        }
        double v = 0.0;
        if (mjson_get_number(json.c_str(), static_cast<int>(json.size()), path, &v) == 1) {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%g", v);
            out = buf;
            return true;
        }
        return false;
    }

    static bool findObject(const std::string& json, const char* path, std::string& out) {
        const char* tok = nullptr;
        int toklen = 0;
        if (mjson_find(json.c_str(), static_cast<int>(json.size()), path, &tok, &toklen) != MJSON_TOK_OBJECT) {
            return false;
        }
        out.assign(tok, static_cast<std::size_t>(toklen));
        return true;
    }

    static bool hasMember(const std::string& json, const char* path) {
        const char* tok = nullptr;
        int toklen = 0;
        return mjson_find(json.c_str(), static_cast<int>(json.size()), path, &tok, &toklen) != MJSON_TOK_INVALID;
    }

    static const char* orUnknown(const std::string& s) {
        return s.empty() ? "Unknown" : s.c_str();
    }
}

NegotiationTimings NegotiationTimings::defaults() {
    NegotiationTimings t;
    t.probe_timeout_ms = Config::Negotiation::probe_timeout_ms;
    t.version_timeout_ms = Config::Negotiation::version_timeout_ms;
    t.settings_timeout_ms = Config::Negotiation::settings_timeout_ms;
    t.settle_before_probe_ms = Config::Negotiation::settle_before_probe_ms;
    t.settle_after_init_ms = Config::Negotiation::settle_after_init_ms;
    t.inter_byte_delay_ms = Config::Serial::inter_byte_delay_ms;
    t.prompt_timeout_ms = Config::Negotiation::prompt_timeout_ms;
    t.after_prompt_delay_ms = Config::Negotiation::after_prompt_delay_ms;
    t.legacy_response_window_ms = Config::Negotiation::legacy_response_window_ms;
    t.between_commands_delay_ms = Config::Negotiation::between_commands_delay_ms;
    return t;
}

ProtocolNegotiator::ProtocolNegotiator(SerialPort& port,
                                       const std::string& sensor_id,
                                       const std::atomic<bool>& stop_requested,
                                       NegotiationListener* listener,
                                       const NegotiationTimings& timings)
    : port(port),
      sensor_id(sensor_id),
      stop_requested(stop_requested),
      listener(listener),
      timings(timings) {}

const char* ProtocolNegotiator::statusName(NegotiationStatus status) {
    switch (status) {
        case NegotiationStatus::STRUCTURED: return "structured";
        case NegotiationStatus::LEGACY:     return "legacy";
        case NegotiationStatus::NONE:       return "none";
        case NegotiationStatus::STOPPED:    return "stopped";
        case NegotiationStatus::IO_ERROR:   return "i/o error";
    }
    return "unknown";
}

bool ProtocolNegotiator::pause(uint32_t ms) {
    Clock::time_point deadline = Clock::now() + std::chrono::milliseconds(ms);
    while (!stop_requested.load()) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
        if (left <= 0) {
            return true;
        }
        long long step = std::min<long long>(left, Config::Negotiation::poll_interval_ms);
        std::this_thread::sleep_for(std::chrono::milliseconds(step));
    }
    return false;
}

void ProtocolNegotiator::progress(const std::string& text) {
    if (listener != nullptr) {
        listener->onProgress(text);
    }
}

void ProtocolNegotiator::error(const std::string& text) {
    if (listener != nullptr) {
        listener->onError(text);
    }
}

NegotiationStatus ProtocolNegotiator::negotiate(const std::vector<std::string>& init_commands, NegotiatedProtocol& out) {
    out = NegotiatedProtocol();

    SensorInfo info;
    NegotiationStatus st = tryStructured(info);
    if (st == NegotiationStatus::STRUCTURED) {
        out.kind = ProtocolKind::STRUCTURED;
        out.info = info;
        return st;
    }
    if (st == NegotiationStatus::STOPPED || st == NegotiationStatus::IO_ERROR) {
        return st;
    }

    if (!init_commands.empty()) {
        LOG_INFO(TAG, "%s: Structured protocol not available, trying legacy CLI commands", sensor_id.c_str());
        st = runLegacy(init_commands);
        if (st == NegotiationStatus::LEGACY) {
            out.kind = ProtocolKind::LEGACY;
        }
        return st;
    }

    LOG_INFO(TAG, "%s: No initialization, starting data read immediately", sensor_id.c_str());
    return NegotiationStatus::NONE;
}

NegotiationStatus ProtocolNegotiator::tryStructured(SensorInfo& out_info) {
    LOG_INFO(TAG, "%s: Attempting structured protocol initialization", sensor_id.c_str());

    // Let in-flight telemetry settle, then start from an empty input buffer
    if (!pause(timings.settle_before_probe_ms)) {
        return NegotiationStatus::STOPPED;
    }
    if (!port.flushInput()) {
        LOG_ERROR(TAG, "%s: Input flush failed: %s", sensor_id.c_str(), port.lastError().c_str());
        return NegotiationStatus::IO_ERROR;
    }

    // {json}: protocol capability probe
    if (!ResponseReader::writePaced(port, Config::Negotiation::probe_command, timings.inter_byte_delay_ms)) {
        return NegotiationStatus::IO_ERROR;
    }
    CommandResponse probe = ResponseReader::collect(port, timings.probe_timeout_ms, stop_requested);
    if (probe.status == ResponseStatus::IO_ERROR) {
        return NegotiationStatus::IO_ERROR;
    }
    if (probe.status == ResponseStatus::STOPPED) {
        return NegotiationStatus::STOPPED;
    }
    if (probe.status == ResponseStatus::NO_RESPONSE) {
        LOG_WARN(TAG, "%s: No response to %s", sensor_id.c_str(), Config::Negotiation::probe_command);
        return NegotiationStatus::NONE;
    }
    if (probe.status == ResponseStatus::REJECTED) {
        LOG_INFO(TAG, "%s: Structured protocol not supported (probe rejected)", sensor_id.c_str());
        return NegotiationStatus::NONE;
    }
    if (probe.status != ResponseStatus::JSON || !hasMember(probe.text, "$.JSON")) {
        LOG_WARN(TAG, "%s: Unexpected probe response: %s", sensor_id.c_str(), probe.text.c_str());
        return NegotiationStatus::NONE;
    }

    SensorInfo info;
    if (!getScalarText(probe.text, "$.Version", info.firmware_version)) {
        info.firmware_version = "unknown";
    }
    LOG_INFO(TAG, "%s: Structured protocol confirmed (FW: %s)", sensor_id.c_str(), info.firmware_version.c_str());
    progress("JSON Protocol v" + info.firmware_version);

    // {version}: plain-text identification block
    if (!ResponseReader::writePaced(port, Config::Negotiation::version_command, timings.inter_byte_delay_ms)) {
        return NegotiationStatus::IO_ERROR;
    }
    CommandResponse version = ResponseReader::collect(port, timings.version_timeout_ms, stop_requested);
    if (version.status == ResponseStatus::IO_ERROR) {
        return NegotiationStatus::IO_ERROR;
    }
    if (version.status == ResponseStatus::STOPPED) {
        return NegotiationStatus::STOPPED;
    }
    if (version.answered()) {
        info.raw_version = version.text;
        if (version.status == ResponseStatus::RAW) {
            applyVersionText(version.text, info);
            progress(std::string("Model: ") + orUnknown(info.model));
        }
    } else {
        LOG_DEBUG(TAG, "%s: %s gave %s", sensor_id.c_str(), Config::Negotiation::version_command,
                  ResponseReader::statusName(version.status));
    }

    // {settings}: configuration object
    if (!ResponseReader::writePaced(port, Config::Negotiation::settings_command, timings.inter_byte_delay_ms)) {
        return NegotiationStatus::IO_ERROR;
    }
    CommandResponse settings = ResponseReader::collect(port, timings.settings_timeout_ms, stop_requested);
    if (settings.status == ResponseStatus::IO_ERROR) {
        return NegotiationStatus::IO_ERROR;
    }
    if (settings.status == ResponseStatus::STOPPED) {
        return NegotiationStatus::STOPPED;
    }
    if (settings.status == ResponseStatus::JSON && applySettingsJson(settings.text, info)) {
        LOG_INFO(TAG, "%s: Settings retrieved - Model: %s, S/N: %s, Sample Rate: %sHz", sensor_id.c_str(),
                 orUnknown(info.model), orUnknown(info.serial_number), orUnknown(info.sample_rate));
        progress(std::string("S/N: ") + orUnknown(info.serial_number) + ", Rate: " + orUnknown(info.sample_rate) + "Hz");
    } else if (settings.answered()) {
        // Unrecognised shape; kept for display
        info.raw_settings = settings.text;
        LOG_DEBUG(TAG, "%s: Settings reply kept unparsed", sensor_id.c_str());
    }

    if (!pause(timings.settle_after_init_ms)) {
        return NegotiationStatus::STOPPED;
    }
    if (!port.flushInput()) {
        LOG_ERROR(TAG, "%s: Input flush failed: %s", sensor_id.c_str(), port.lastError().c_str());
        return NegotiationStatus::IO_ERROR;
    }

    LOG_INFO(TAG, "%s: Structured initialization completed", sensor_id.c_str());
    out_info = info;
    return NegotiationStatus::STRUCTURED;
}

NegotiationStatus ProtocolNegotiator::runLegacy(const std::vector<std::string>& init_commands) {
    LOG_INFO(TAG, "%s: Starting legacy initialization sequence", sensor_id.c_str());

    // Ctrl+C enters the CLI
    const uint8_t interrupt = Config::Negotiation::interrupt_byte;
    if (!port.write(&interrupt, 1) || !port.drain()) {
        std::string msg = std::string("Serial error during initialization: ") + port.lastError();
        LOG_ERROR(TAG, "%s: %s", sensor_id.c_str(), msg.c_str());
        error(msg);
        return NegotiationStatus::IO_ERROR;
    }
    progress("Ctrl+C (entering CLI mode)");

    bool prompt_seen = false;
    std::string received;
    std::string line;
    Clock::time_point deadline = Clock::now() + std::chrono::milliseconds(timings.prompt_timeout_ms);
    while (!prompt_seen) {
        if (stop_requested.load()) {
            LOG_WARN(TAG, "%s: Initialization interrupted by stop request", sensor_id.c_str());
            return NegotiationStatus::STOPPED;
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
        if (left <= 0) {
            break;
        }
        uint32_t wait_ms = static_cast<uint32_t>(std::min<long long>(left, Config::Serial::read_timeout_ms));
        ReadStatus st = port.readLine(line, wait_ms);
        if (st == ReadStatus::ERROR) {
            std::string msg = std::string("Serial error during initialization: ") + port.lastError();
            LOG_ERROR(TAG, "%s: %s", sensor_id.c_str(), msg.c_str());
            error(msg);
            return NegotiationStatus::IO_ERROR;
        }
        // The prompt usually arrives without a newline, so partial input counts too
        line = trim(line);
        if (line.empty()) {
            continue;
        }
        LOG_DEBUG(TAG, "%s: CLI response: %s", sensor_id.c_str(), line.c_str());
        if (!received.empty()) {
            received += " | ";
        }
        received += line;
        if (line.find(Config::Negotiation::prompt_marker) != std::string::npos) {
            prompt_seen = true;
        }
    }

    if (prompt_seen) {
        LOG_INFO(TAG, "%s: CLI mode confirmed (prompt received)", sensor_id.c_str());
        if (!pause(timings.after_prompt_delay_ms)) {
            return NegotiationStatus::STOPPED;
        }
    } else {
        LOG_WARN(TAG, "%s: CLI prompt '%c' not detected. Received: [%s]. Attempting to continue anyway",
                 sensor_id.c_str(), Config::Negotiation::prompt_marker, received.c_str());
    }

    for (const std::string& cmd : init_commands) {
        if (stop_requested.load()) {
            LOG_WARN(TAG, "%s: Initialization interrupted by stop request", sensor_id.c_str());
            return NegotiationStatus::STOPPED;
        }

        std::string wire = cmd + "\r\n";
        LOG_DEBUG(TAG, "%s: Sending command: %s", sensor_id.c_str(), cmd.c_str());
        if (!port.write(reinterpret_cast<const uint8_t*>(wire.data()), wire.size()) || !port.drain()) {
            std::string msg = "Serial error sending command '" + cmd + "': " + port.lastError();
            LOG_ERROR(TAG, "%s: %s", sensor_id.c_str(), msg.c_str());
            error(msg);
            return NegotiationStatus::IO_ERROR;
        }
        progress(cmd);

        // The whole window is read; devices may echo more than one line
        std::size_t response_lines = 0;
        deadline = Clock::now() + std::chrono::milliseconds(timings.legacy_response_window_ms);
        for (;;) {
            if (stop_requested.load()) {
                LOG_WARN(TAG, "%s: Initialization interrupted by stop request", sensor_id.c_str());
                return NegotiationStatus::STOPPED;
            }
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
            if (left <= 0) {
                break;
            }
            uint32_t wait_ms = static_cast<uint32_t>(std::min<long long>(left, Config::Serial::read_timeout_ms));
            ReadStatus st = port.readLine(line, wait_ms);
            if (st == ReadStatus::ERROR) {
                std::string msg = "Serial error sending command '" + cmd + "': " + port.lastError();
                LOG_ERROR(TAG, "%s: %s", sensor_id.c_str(), msg.c_str());
                error(msg);
                return NegotiationStatus::IO_ERROR;
            }
            line = trim(line);
            if (line.empty()) {
                continue;
            }
            ++response_lines;
            LOG_DEBUG(TAG, "%s: Response: %s", sensor_id.c_str(), line.c_str());
            if (containsNoCase(line, "error") || containsNoCase(line, "invalid")) {
                std::string msg = "Command '" + cmd + "' returned error: " + line;
                LOG_ERROR(TAG, "%s: %s", sensor_id.c_str(), msg.c_str());
                error(msg);
            }
        }
        if (response_lines == 0) {
            LOG_WARN(TAG, "%s: No response to command '%s' (may be normal)", sensor_id.c_str(), cmd.c_str());
        }

        if (!pause(timings.between_commands_delay_ms)) {
            LOG_WARN(TAG, "%s: Initialization interrupted by stop request", sensor_id.c_str());
            return NegotiationStatus::STOPPED;
        }
    }

    LOG_INFO(TAG, "%s: Initialization sequence completed", sensor_id.c_str());

    if (!pause(timings.settle_after_init_ms)) {
        return NegotiationStatus::STOPPED;
    }
    if (!port.flushInput()) {
        LOG_ERROR(TAG, "%s: Input flush failed: %s", sensor_id.c_str(), port.lastError().c_str());
        return NegotiationStatus::IO_ERROR;
    }
    return NegotiationStatus::LEGACY;
}

void ProtocolNegotiator::applyVersionText(const std::string& raw, SensorInfo& info) {
    std::size_t start = 0;
    while (start <= raw.size()) {
        std::size_t end = raw.find('\n', start);
        if (end == std::string::npos) {
            end = raw.size();
        }
        std::string line = raw.substr(start, end - start);

        if (line.find("TriSonica") != std::string::npos) {
            info.model = trim(line);
        } else if (line.find("Serial Number:") != std::string::npos) {
            info.serial_number = afterColon(line);
        } else if (line.find("Version:") != std::string::npos && info.firmware_version.empty()) {
            info.firmware_version = afterColon(line);
        }
        start = end + 1;
    }
}

bool ProtocolNegotiator::applySettingsJson(const std::string& json, SensorInfo& info) {
    // Either {"Settings": {...}} or the settings object itself
    std::string settings;
    if (!findObject(json, "$.Settings", settings)) {
        settings = json;
    }

    bool recognised = hasMember(settings, "$.Model") || hasMember(settings, "$.Serial Number") ||
                      hasMember(settings, "$.Probe") || hasMember(settings, "$.Output") ||
                      hasMember(settings, "$.Display");
    if (!recognised) {
        return false;
    }

    std::string value;
    if (getScalarText(settings, "$.Model", value)) {
        info.model = value;
    }
    if (getScalarText(settings, "$.Serial Number", value)) {
        info.serial_number = value;
    }
    if (getScalarText(settings, "$.Probe.SampleRate", value)) {
        info.sample_rate = value;
    }

    std::string output;
    if (findObject(settings, "$.Output", output) || findObject(settings, "$.Display.Output", output)) {
        std::vector<std::string> tags;
        for (const OutputTagMapping& m : output_tag_map) {
            std::string path = std::string("$.") + m.name;
            std::string enabled;
            if (getString(output, path.c_str(), enabled) && enabled == "Yes") {
                tags.push_back(m.tag);
            }
        }
        if (!tags.empty()) {
            info.enabled_tags = tags;
        }
    }
    return true;
}
