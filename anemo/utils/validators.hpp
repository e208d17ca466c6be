// Checks for user-supplied settings (command line and console commands).
#ifndef VALIDATORS_HPP
#define VALIDATORS_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace Validators {
    static constexpr std::size_t valid_baud_count = 5;
    static constexpr uint32_t valid_baud_rates[valid_baud_count] = { 9600, 19200, 38400, 57600, 115200 };

    bool isValidBaud(uint32_t baud);

    // Parses a decimal baud rate and checks it against the allowed set
    bool parseBaud(const std::string& text, uint32_t& out_baud);

    // [A-Za-z0-9_]{1,20}
    bool isValidSensorId(const std::string& sensor_id);

    // Device path: non-empty, bounded length, no whitespace or control characters
    bool isValidPort(const std::string& port);

    // 1-10 Hz
    bool isValidOutputRate(int rate_hz);

    // Export destination: non-empty, no ".." component, ".csv" extension
    // (any case). On failure out_error holds the reason.
    bool validateCsvPath(const std::string& path, std::string& out_error);
}

#endif // VALIDATORS_HPP
