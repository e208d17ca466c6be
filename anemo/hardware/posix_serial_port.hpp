#ifndef POSIX_SERIAL_PORT_HPP
#define POSIX_SERIAL_PORT_HPP

#include <anemo/hardware/serial_port.hpp>
#include <termios.h>
#include <mutex>
#include <string>

// termios-backed serial port (/dev/ttyUSB*, /dev/ttyACM*, ...)
class PosixSerialPort : public SerialPort {
public:
    PosixSerialPort();
    ~PosixSerialPort() override;

    PosixSerialPort(const PosixSerialPort&) = delete;
    PosixSerialPort& operator=(const PosixSerialPort&) = delete;

    bool open(const std::string& port, uint32_t baud) override;
    void close() override;
    bool isOpen() const override { return fd >= 0; }

    ReadStatus readLine(std::string& out_line, uint32_t timeout_ms) override;
    long bytesAvailable() override;

    bool write(const uint8_t* data, std::size_t len) override;
    bool drain() override;
    bool flushInput() override;
    bool flushOutput() override;

    std::string lastError() const override;

    // termios speed constant for a baud rate; false if unsupported
    static bool baudToSpeed(uint32_t baud, speed_t& out_speed);

private:
    bool configure(uint32_t baud);
    bool takeLine(std::string& out_line);
    // Appends strerror(errno)
    void setError(const char* what);
    void setErrorText(const std::string& text);

    int fd;
    std::string port_name;
    // Bytes read past the last returned line
    std::string rx_pending;
    // Set after an over-long line; input is discarded until the next '\n'
    bool dropping;
    // Written by the reader and by writers on other threads
    mutable std::mutex error_mutex;
    std::string last_error;
};

#endif // POSIX_SERIAL_PORT_HPP
