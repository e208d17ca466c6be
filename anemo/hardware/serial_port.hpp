#ifndef SERIAL_PORT_HPP
#define SERIAL_PORT_HPP

#include <cstddef>
#include <cstdint>
#include <string>

enum class ReadStatus : uint8_t {
    LINE = 0,     // a complete line was returned
    TIMEOUT = 1,  // no complete line in time
    ERROR = 2,    // the link failed; the port should be closed
};

// Line-oriented serial link, 8N1. One reader thread; write() may be called from
// another thread while a read is in progress.
class SerialPort {
public:
    virtual ~SerialPort() {}

    virtual bool open(const std::string& port, uint32_t baud) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    // Reads one '\n'-terminated line with the terminator and any '\r' removed.
    // On TIMEOUT out_line holds whatever unterminated input arrived (possibly
    // empty); that input is consumed either way.
    virtual ReadStatus readLine(std::string& out_line, uint32_t timeout_ms) = 0;

    // Received bytes not yet consumed, or -1 on I/O error
    virtual long bytesAvailable() = 0;

    virtual bool write(const uint8_t* data, std::size_t len) = 0;
    // Blocks until queued output has been transmitted
    virtual bool drain() = 0;

    virtual bool flushInput() = 0;
    virtual bool flushOutput() = 0;

    // Text of the most recent failure (empty if none). Safe from any thread.
    virtual std::string lastError() const = 0;
};

#endif // SERIAL_PORT_HPP
