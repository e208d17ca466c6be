// Framing and classification of replies to brace-delimited commands
// ({json}, {version}, {settings}, ...).
#ifndef RESPONSE_READER_HPP
#define RESPONSE_READER_HPP

#include <anemo/hardware/serial_port.hpp>
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

enum class ResponseStatus : uint8_t {
    JSON = 0,         // text holds a JSON object (single-key wrapper already removed)
    RAW = 1,          // text holds the reply verbatim, lines joined with '\n'
    NO_RESPONSE = 2,  // nothing but telemetry (or nothing at all) before the timeout
    REJECTED = 3,     // device answered "Invalid Command" / "Invalid Parameter"
    IO_ERROR = 4,     // the port failed while waiting
    STOPPED = 5,      // stop requested while waiting
};

struct CommandResponse {
    ResponseStatus status = ResponseStatus::NO_RESPONSE;
    std::string text;

    bool answered() const { return status == ResponseStatus::JSON || status == ResponseStatus::RAW; }
};

// Collects reply lines. Telemetry lines interleaved with the reply are skipped;
// the reply is complete once a '{' has been seen and the running brace count
// returns to zero.
class ResponseFramer {
public:
    ResponseFramer();

    // Returns true when the reply is complete (or the line limit was reached)
    bool addLine(const std::string& line);

    bool isComplete() const { return complete; }
    const std::vector<std::string>& lines() const { return collected; }

private:
    std::vector<std::string> collected;
    int brace_depth;
    bool in_object;
    bool complete;
};

namespace ResponseReader {
    const char* statusName(ResponseStatus status);

    // Classifies collected reply lines. Rejection is checked first; then the
    // joined text is parsed as an object (unwrapping a single-key wrapper whose
    // value is an object); failing that the inner {...} is tried; anything
    // else is kept as RAW.
    CommandResponse classify(const std::vector<std::string>& lines);

    // Writes command one byte at a time with inter_byte_delay_ms between bytes,
    // then waits for the output to drain.
    bool writePaced(SerialPort& port, const std::string& command, uint32_t inter_byte_delay_ms);

    // Reads lines until the framer completes or timeout_ms elapses, then classifies.
    CommandResponse collect(SerialPort& port, uint32_t timeout_ms, const std::atomic<bool>& stop_requested);

    // True if text is exactly one well-formed JSON value
    bool isWellFormedJson(const std::string& text);
}

#endif // RESPONSE_READER_HPP
