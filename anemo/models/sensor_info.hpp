#ifndef SENSOR_INFO_HPP
#define SENSOR_INFO_HPP

#include <cstdint>
#include <string>
#include <vector>

// Decided once per connection by the negotiator
enum class ProtocolKind : uint8_t {
    UNKNOWN = 0,     // nothing negotiated; device assumed to be streaming already
    STRUCTURED = 1,  // brace-delimited JSON commands ({json}, {settings}, ...)
    LEGACY = 2,      // plain-text CLI entered with Ctrl+C
};

// Device metadata reported over the structured protocol. Empty strings mean
// "not reported".
struct SensorInfo {
    std::string model;
    std::string serial_number;
    std::string firmware_version;
    std::string sample_rate;
    std::vector<std::string> enabled_tags;
    // Responses that did not have the expected shape, kept verbatim
    std::string raw_version;
    std::string raw_settings;
};

// Tagged result: info is only meaningful when kind == STRUCTURED.
struct NegotiatedProtocol {
    ProtocolKind kind = ProtocolKind::UNKNOWN;
    SensorInfo   info;

    bool isStructured() const { return kind == ProtocolKind::STRUCTURED; }
};

inline const char* protocolKindName(ProtocolKind kind) {
    switch (kind) {
        case ProtocolKind::STRUCTURED: return "JSON";
        case ProtocolKind::LEGACY:     return "Legacy CLI";
        case ProtocolKind::UNKNOWN:    return "Unknown";
    }
    return "Unknown";
}

#endif // SENSOR_INFO_HPP
