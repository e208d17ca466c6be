#ifndef PROTOCOL_NEGOTIATOR_HPP
#define PROTOCOL_NEGOTIATOR_HPP

#include <anemo/hardware/serial_port.hpp>
#include <anemo/models/sensor_info.hpp>
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

// Waits used by the handshake. Defaults come from Config::Negotiation and
// Config::Serial; tests shorten them.
struct NegotiationTimings {
    uint32_t probe_timeout_ms;
    uint32_t version_timeout_ms;
    uint32_t settings_timeout_ms;
    uint32_t settle_before_probe_ms;
    uint32_t settle_after_init_ms;
    uint32_t inter_byte_delay_ms;
    uint32_t prompt_timeout_ms;
    uint32_t after_prompt_delay_ms;
    uint32_t legacy_response_window_ms;
    uint32_t between_commands_delay_ms;

    static NegotiationTimings defaults();
};

enum class NegotiationStatus : uint8_t {
    STRUCTURED = 0,  // structured protocol confirmed; info filled
    LEGACY = 1,      // legacy init sequence sent
    NONE = 2,        // nothing to do; device assumed to stream already
    STOPPED = 3,     // stop requested part way through
    IO_ERROR = 4,    // the port failed; the connection is lost
};

// Receives initialization progress and non-fatal errors as they happen
class NegotiationListener {
public:
    virtual ~NegotiationListener() {}
    virtual void onProgress(const std::string& text) = 0;
    virtual void onError(const std::string& text) = 0;
};

class ProtocolNegotiator {
public:
    ProtocolNegotiator(SerialPort& port,
                       const std::string& sensor_id,
                       const std::atomic<bool>& stop_requested,
                       NegotiationListener* listener,
                       const NegotiationTimings& timings = NegotiationTimings::defaults());

    // Structured handshake first; legacy init sequence only if that fails and
    // init_commands is not empty. out.kind is set for every status.
    NegotiationStatus negotiate(const std::vector<std::string>& init_commands, NegotiatedProtocol& out);

    // {json} probe, then {version} and {settings}
    NegotiationStatus tryStructured(SensorInfo& out_info);

    // Ctrl+C, optional '>' prompt, then each command with its own response window
    NegotiationStatus runLegacy(const std::vector<std::string>& init_commands);

    // Fills model / serial number / firmware from a plain-text {version} reply.
    // Existing firmware_version is kept.
    static void applyVersionText(const std::string& raw, SensorInfo& info);

    // Fills model / serial number / sample rate / enabled tags from a {settings}
    // object. Returns false (info untouched) if the shape is not recognised.
    static bool applySettingsJson(const std::string& json, SensorInfo& info);

    static const char* statusName(NegotiationStatus status);

private:
    // Sleeps in short steps; false if a stop was requested meanwhile
    bool pause(uint32_t ms);
    void progress(const std::string& text);
    void error(const std::string& text);

    SerialPort& port;
    std::string sensor_id;
    const std::atomic<bool>& stop_requested;
    NegotiationListener* listener;
    NegotiationTimings timings;
};

#endif // PROTOCOL_NEGOTIATOR_HPP
