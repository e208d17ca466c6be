#ifndef FAST_TIMINGS_HPP
#define FAST_TIMINGS_HPP

#include <anemo/protocol/protocol_negotiator.hpp>

// Handshake waits short enough for unit tests
inline NegotiationTimings fastTimings() {
    NegotiationTimings t;
    t.probe_timeout_ms = 150;
    t.version_timeout_ms = 100;
    t.settings_timeout_ms = 150;
    t.settle_before_probe_ms = 0;
    t.settle_after_init_ms = 0;
    t.inter_byte_delay_ms = 0;
    t.prompt_timeout_ms = 100;
    t.after_prompt_delay_ms = 0;
    t.legacy_response_window_ms = 60;
    t.between_commands_delay_ms = 0;
    return t;
}

#endif // FAST_TIMINGS_HPP
