// Wall-clock helpers with fixed-length timestamp formatting.
#ifndef TIME_FORMAT_HPP
#define TIME_FORMAT_HPP

#include <cstddef>
#include <cstdint>

namespace TimeFormat {
    // Length of a formatted timestamp without terminator: "YYYY-MM-DD HH:MM:SS.mmm"
    static constexpr std::size_t timestamp_len = 23;

    // Milliseconds since the Unix epoch (system clock).
    int64_t nowEpochMs();

    // Milliseconds since process start (steady clock), used for log prefixes.
    uint64_t uptimeMs();

    // Writes epoch_ms as local time "YYYY-MM-DD HH:MM:SS.mmm".
    // Always null-terminates when out_size > 0. Returns false if the buffer is too small
    // or the time cannot be converted.
    bool formatTimestampMs(int64_t epoch_ms, char* out, std::size_t out_size);
}

#endif // TIME_FORMAT_HPP
