#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace Config {
namespace Sensors {
    // Number of acquisition slots (Sensor1..Sensor4)
    static constexpr std::size_t max_sensors = 4;
    static constexpr const char* default_ids[max_sensors] = { "Sensor1", "Sensor2", "Sensor3", "Sensor4" };

    // Sensor identifiers are [A-Za-z0-9_]{1,20}
    static constexpr std::size_t id_max_len = 20;
    static constexpr std::size_t port_max_len = 63;

    static constexpr uint32_t default_baud = 115200;
    static constexpr std::size_t max_init_commands = 16;
    static constexpr std::size_t init_command_max_len = 63;
}

namespace Serial {
    // 8N1, no flow control
    static constexpr uint32_t read_timeout_ms = 1000;
    static constexpr uint32_t write_timeout_ms = 2000;
    // Longest accepted line; longer input is dropped until the next newline
    static constexpr std::size_t max_line_len = 512;
    // Pacing between bytes of a command (device drops unpaced input)
    static constexpr uint32_t inter_byte_delay_ms = 10;
    // Settle time after a paced command has been written
    static constexpr uint32_t post_command_delay_ms = 100;
}

namespace Negotiation {
    static constexpr const char* probe_command = "{json}";
    static constexpr const char* version_command = "{version}";
    static constexpr const char* settings_command = "{settings}";

    static constexpr uint32_t probe_timeout_ms = 2000;
    static constexpr uint32_t version_timeout_ms = 2000;
    static constexpr uint32_t settings_timeout_ms = 3000;
    // Quiet period before the probe and before handing over to the read loop
    static constexpr uint32_t settle_before_probe_ms = 300;
    static constexpr uint32_t settle_after_init_ms = 200;
    // Poll interval while waiting for response lines
    static constexpr uint32_t poll_interval_ms = 50;

    // Legacy CLI
    static constexpr uint8_t interrupt_byte = 0x03;
    static constexpr char prompt_marker = '>';
    static constexpr uint32_t prompt_timeout_ms = 2000;
    static constexpr uint32_t after_prompt_delay_ms = 100;
    static constexpr uint32_t legacy_response_window_ms = 2000;
    static constexpr uint32_t between_commands_delay_ms = 100;

    // Upper bound on a collected response (lines)
    static constexpr std::size_t max_response_lines = 64;
}

namespace Acquisition {
    // ~2.2 hours at 25 Hz
    static constexpr std::size_t buffer_capacity = 200000;
    // Unread input above this many bytes is discarded instead of parsed
    static constexpr std::size_t overflow_threshold_bytes = 4096;
    // Bounded join when a worker is stopped
    static constexpr uint32_t stop_join_timeout_ms = 5000;
    static constexpr uint32_t reconnect_join_timeout_ms = 2000;
}

namespace Reconnect {
    static constexpr int max_attempts = 4;
    // delay = base_delay_ms * 2^attempt -> 1s, 2s, 4s, 8s
    static constexpr uint32_t base_delay_ms = 1000;
}

namespace Sync {
    // Nearest-neighbour tolerance for multi-sensor alignment
    static constexpr int64_t tolerance_ms = 500;
}

namespace Export {
    static constexpr const char* missing_cell = "N/A";
    static constexpr int decimals = 2;
}

namespace Output {
    static constexpr int min_rate_hz = 1;
    static constexpr int max_rate_hz = 10;
}

namespace Tasks {
namespace Controller {
    // Worker -> controller events
    static constexpr std::size_t event_queue_len = 256;
    // Slots readings may not take, kept free for status and error events
    static constexpr std::size_t event_reserved_slots = 16;
    // Status/error events wait this long for queue space; readings never wait
    static constexpr uint32_t event_post_timeout_ms = 100;
    // Event queue drain wait per controller per loop
    static constexpr uint32_t pump_wait_ms = 20;
    static constexpr std::size_t command_queue_len = 16;
}
namespace Stats {
    static constexpr uint32_t period_ms = 5000;
}
namespace Memory {
    static constexpr uint32_t period_ms = 30000;
    static constexpr double warning_threshold_mb = 500.0;
}
}

// Feature toggles to enable/disable subsystems at build time
namespace Features {
    static constexpr bool enable_memory_monitor = true;
    static constexpr bool enable_rate_stats     = true;
    static constexpr bool enable_console        = true;
}
}

#endif // CONFIG_HPP
