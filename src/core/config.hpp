#pragma once

#include "core/device.hpp"
#include "core/result.hpp"
#include <QSettings>
#include <QString>
#include <cstdint>

namespace rally {

/**
 * ReconnectionConfig - backoff schedule for the reconnection loop.
 *
 * delay(n) = min(base_delay_ms * backoff_factor^(n-1), max_delay_ms)
 */
struct ReconnectionConfig {
    int max_attempts = 10;
    int base_delay_ms = 2000;
    int max_delay_ms = 30000;
    double backoff_factor = 2.0;
};

enum class ConflictStrategy {
    Timestamp,
    RolePriority
};

[[nodiscard]] QString conflictStrategyName(ConflictStrategy strategy);

/**
 * SyncConfig - every recognized option of the sync core.
 */
struct SyncConfig {
    QString device_name;
    DeviceRole device_role = DeviceRole::Spectator;
    bool enable_auto_sync = true;
    bool debug_trace = false;
    ReconnectionConfig reconnection;

    QString signaling_host = QStringLiteral("127.0.0.1");
    uint16_t signaling_port = 47900;
    int signaling_timeout_ms = 10000;
    int negotiation_timeout_ms = 30000;
    int heartbeat_interval_ms = 5000;
    int heartbeat_miss_limit = 3;
    int ack_timeout_ms = 5000;
    int operation_max_retries = 3;
    int max_queue_size = 1000;
    ConflictStrategy conflict_strategy = ConflictStrategy::Timestamp;

    /**
     * Reject values the engine cannot run with.
     */
    [[nodiscard]] Result<void, Error> validate() const;

    /**
     * Read from "sync/..." keys; missing keys keep the defaults.
     */
    [[nodiscard]] static SyncConfig load(QSettings& settings);
    void save(QSettings& settings) const;
};

} // namespace rally
