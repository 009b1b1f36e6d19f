#pragma once

#include "core/config.hpp"
#include <algorithm>

namespace rally::sync {

/**
 * Delay before the attempt that follows attempt `attempt` (1-based):
 * base * factor^(attempt-1), capped at the configured maximum.
 */
[[nodiscard]] inline int backoff_delay_ms(const ReconnectionConfig& config, int attempt) {
    if (attempt <= 1) {
        return std::min(config.base_delay_ms, config.max_delay_ms);
    }
    double delay = config.base_delay_ms;
    for (int i = 1; i < attempt; ++i) {
        delay *= config.backoff_factor;
        if (delay >= config.max_delay_ms) {
            return config.max_delay_ms;
        }
    }
    return static_cast<int>(delay);
}

struct ReconnectDecision {
    bool give_up = false;
    int delay_ms = 0;
};

/**
 * What to do after `attempts_made` failed attempts. The first attempt of a
 * run is immediate; once the ceiling is reached the loop stops until a
 * forced reconnect starts a new run.
 */
[[nodiscard]] inline ReconnectDecision decide_reconnect(const ReconnectionConfig& config,
                                                        int attempts_made) {
    if (attempts_made >= config.max_attempts) {
        return {true, 0};
    }
    if (attempts_made == 0) {
        return {false, 0};
    }
    return {false, backoff_delay_ms(config, attempts_made)};
}

} // namespace rally::sync
