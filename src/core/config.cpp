#include "core/config.hpp"

namespace rally {

namespace {

Result<void, Error> invalid(const char* message) {
    return Result<void, Error>::err(make_error(ErrorCode::InvalidArgument, message));
}

} // namespace

QString conflictStrategyName(ConflictStrategy strategy) {
    return strategy == ConflictStrategy::RolePriority ? QStringLiteral("role-priority")
                                                      : QStringLiteral("timestamp");
}

Result<void, Error> SyncConfig::validate() const {
    if (device_name.trimmed().isEmpty()) {
        return invalid("Device name must not be empty");
    }
    if (reconnection.max_attempts < 1) {
        return invalid("Reconnection attempt ceiling must be at least 1");
    }
    if (reconnection.base_delay_ms <= 0) {
        return invalid("Reconnection base delay must be positive");
    }
    if (reconnection.max_delay_ms < reconnection.base_delay_ms) {
        return invalid("Reconnection max delay must not be below the base delay");
    }
    if (reconnection.backoff_factor < 1.0) {
        return invalid("Backoff factor must be at least 1");
    }
    if (signaling_port == 0) {
        return invalid("Signaling port must be set");
    }
    if (signaling_timeout_ms <= 0 || negotiation_timeout_ms <= 0 || ack_timeout_ms <= 0) {
        return invalid("Timeouts must be positive");
    }
    if (heartbeat_interval_ms <= 0 || heartbeat_miss_limit < 1) {
        return invalid("Heartbeat interval and miss limit must be positive");
    }
    if (operation_max_retries < 0) {
        return invalid("Operation retry ceiling must not be negative");
    }
    if (max_queue_size < 1) {
        return invalid("Offline queue size must be at least 1");
    }
    return Result<void, Error>::ok();
}

SyncConfig SyncConfig::load(QSettings& settings) {
    SyncConfig c;
    c.device_name = settings.value("sync/device_name", c.device_name).toString();
    c.device_role = parseRole(settings.value("sync/device_role", roleName(c.device_role)).toString())
                        .value_or(c.device_role);
    c.enable_auto_sync = settings.value("sync/enable_auto_sync", c.enable_auto_sync).toBool();
    c.debug_trace = settings.value("sync/debug_trace", c.debug_trace).toBool();

    c.reconnection.max_attempts =
        settings.value("sync/reconnection/max_attempts", c.reconnection.max_attempts).toInt();
    c.reconnection.base_delay_ms =
        settings.value("sync/reconnection/base_delay_ms", c.reconnection.base_delay_ms).toInt();
    c.reconnection.max_delay_ms =
        settings.value("sync/reconnection/max_delay_ms", c.reconnection.max_delay_ms).toInt();
    c.reconnection.backoff_factor =
        settings.value("sync/reconnection/backoff_factor", c.reconnection.backoff_factor).toDouble();

    c.signaling_host = settings.value("sync/signaling_host", c.signaling_host).toString();
    const int port = settings.value("sync/signaling_port", int(c.signaling_port)).toInt();
    if (port > 0 && port <= 65535) {
        c.signaling_port = static_cast<uint16_t>(port);
    }
    c.signaling_timeout_ms = settings.value("sync/signaling_timeout_ms", c.signaling_timeout_ms).toInt();
    c.negotiation_timeout_ms = settings.value("sync/negotiation_timeout_ms", c.negotiation_timeout_ms).toInt();
    c.heartbeat_interval_ms = settings.value("sync/heartbeat_interval_ms", c.heartbeat_interval_ms).toInt();
    c.heartbeat_miss_limit = settings.value("sync/heartbeat_miss_limit", c.heartbeat_miss_limit).toInt();
    c.ack_timeout_ms = settings.value("sync/ack_timeout_ms", c.ack_timeout_ms).toInt();
    c.operation_max_retries = settings.value("sync/operation_max_retries", c.operation_max_retries).toInt();
    c.max_queue_size = settings.value("sync/max_queue_size", c.max_queue_size).toInt();

    const auto strategy = settings.value("sync/conflict_strategy", conflictStrategyName(c.conflict_strategy))
                              .toString();
    c.conflict_strategy = strategy == QStringLiteral("role-priority") ? ConflictStrategy::RolePriority
                                                                      : ConflictStrategy::Timestamp;
    return c;
}

void SyncConfig::save(QSettings& settings) const {
    settings.setValue("sync/device_name", device_name);
    settings.setValue("sync/device_role", roleName(device_role));
    settings.setValue("sync/enable_auto_sync", enable_auto_sync);
    settings.setValue("sync/debug_trace", debug_trace);
    settings.setValue("sync/reconnection/max_attempts", reconnection.max_attempts);
    settings.setValue("sync/reconnection/base_delay_ms", reconnection.base_delay_ms);
    settings.setValue("sync/reconnection/max_delay_ms", reconnection.max_delay_ms);
    settings.setValue("sync/reconnection/backoff_factor", reconnection.backoff_factor);
    settings.setValue("sync/signaling_host", signaling_host);
    settings.setValue("sync/signaling_port", int(signaling_port));
    settings.setValue("sync/signaling_timeout_ms", signaling_timeout_ms);
    settings.setValue("sync/negotiation_timeout_ms", negotiation_timeout_ms);
    settings.setValue("sync/heartbeat_interval_ms", heartbeat_interval_ms);
    settings.setValue("sync/heartbeat_miss_limit", heartbeat_miss_limit);
    settings.setValue("sync/ack_timeout_ms", ack_timeout_ms);
    settings.setValue("sync/operation_max_retries", operation_max_retries);
    settings.setValue("sync/max_queue_size", max_queue_size);
    settings.setValue("sync/conflict_strategy", conflictStrategyName(conflict_strategy));
}

} // namespace rally
