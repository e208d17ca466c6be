#include <anemo/utils/time_format.hpp>

#include <chrono>
#include <cstdio>
#include <ctime>

namespace {
    static const std::chrono::steady_clock::time_point s_start = std::chrono::steady_clock::now();

    // Floor division so pre-epoch values keep a positive millisecond part
    static int64_t floorDiv(int64_t a, int64_t b) {
        int64_t q = a / b;
        if ((a % b != 0) && ((a < 0) != (b < 0))) {
            --q;
        }
        return q;
    }
}

namespace TimeFormat {
    int64_t nowEpochMs() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    uint64_t uptimeMs() {
        return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - s_start).count());
    }

    bool formatTimestampMs(int64_t epoch_ms, char* out, std::size_t out_size) {
        if (out_size == 0) {
            return false;
        }
        out[0] = '\0';
        if (out_size < timestamp_len + 1) {
            return false;
        }
        const int64_t seconds = floorDiv(epoch_ms, 1000);
        const int millis = static_cast<int>(epoch_ms - seconds * 1000);
        time_t t = static_cast<time_t>(seconds);
        struct tm tm_local;
        if (localtime_r(&t, &tm_local) == nullptr) {
            return false;
        }
        // strftime ensures null-termination if space permits
        std::size_t n = strftime(out, out_size, "%Y-%m-%d %H:%M:%S", &tm_local);
        if (n == 0) {
            out[0] = '\0';
            return false;
        }
        std::snprintf(out + n, out_size - n, ".%03d", millis);
        return true;
    }
}
