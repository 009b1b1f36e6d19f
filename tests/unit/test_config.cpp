#include <catch2/catch_test_macros.hpp>
#include "core/config.hpp"

#include <QSettings>
#include <QTemporaryDir>

using namespace rally;

namespace {

SyncConfig valid_config() {
    SyncConfig config;
    config.device_name = QStringLiteral("Scorer table");
    return config;
}

} // namespace

TEST_CASE("SyncConfig defaults", "[config]") {
    SyncConfig config;
    REQUIRE(config.enable_auto_sync);
    REQUIRE_FALSE(config.debug_trace);
    REQUIRE(config.reconnection.max_attempts == 10);
    REQUIRE(config.reconnection.base_delay_ms == 2000);
    REQUIRE(config.reconnection.max_delay_ms == 30000);
    REQUIRE(config.reconnection.backoff_factor == 2.0);
    REQUIRE(config.signaling_port == 47900);
    REQUIRE(config.conflict_strategy == ConflictStrategy::Timestamp);
}

TEST_CASE("SyncConfig::validate rejects unusable values", "[config]") {
    REQUIRE(valid_config().validate().is_ok());

    auto expect_invalid = [](const SyncConfig& c) {
        auto r = c.validate();
        REQUIRE(r.is_err());
        REQUIRE(r.unwrap_err().is(ErrorCode::InvalidArgument));
    };

    SyncConfig unnamed;
    expect_invalid(unnamed);

    auto c = valid_config();
    c.reconnection.max_attempts = 0;
    expect_invalid(c);

    c = valid_config();
    c.reconnection.max_delay_ms = c.reconnection.base_delay_ms - 1;
    expect_invalid(c);

    c = valid_config();
    c.reconnection.backoff_factor = 0.5;
    expect_invalid(c);

    c = valid_config();
    c.reconnection.base_delay_ms = 0;
    expect_invalid(c);

    c = valid_config();
    c.max_queue_size = 0;
    expect_invalid(c);
}

TEST_CASE("SyncConfig persists through QSettings", "[config]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = dir.filePath(QStringLiteral("rally.ini"));

    auto config = valid_config();
    config.device_role = DeviceRole::Referee;
    config.enable_auto_sync = false;
    config.reconnection.max_attempts = 4;
    config.reconnection.backoff_factor = 1.5;
    config.signaling_host = QStringLiteral("10.0.0.2");
    config.signaling_port = 5000;
    config.conflict_strategy = ConflictStrategy::RolePriority;
    {
        QSettings settings(path, QSettings::IniFormat);
        config.save(settings);
    }

    QSettings settings(path, QSettings::IniFormat);
    auto loaded = SyncConfig::load(settings);
    REQUIRE(loaded.device_name == config.device_name);
    REQUIRE(loaded.device_role == DeviceRole::Referee);
    REQUIRE_FALSE(loaded.enable_auto_sync);
    REQUIRE(loaded.reconnection.max_attempts == 4);
    REQUIRE(loaded.reconnection.backoff_factor == 1.5);
    REQUIRE(loaded.signaling_host == QStringLiteral("10.0.0.2"));
    REQUIRE(loaded.signaling_port == 5000);
    REQUIRE(loaded.conflict_strategy == ConflictStrategy::RolePriority);
}

TEST_CASE("SyncConfig::load keeps defaults for missing keys", "[config]") {
    QTemporaryDir dir;
    QSettings settings(dir.filePath(QStringLiteral("empty.ini")), QSettings::IniFormat);
    settings.setValue("sync/signaling_port", 70000);

    auto loaded = SyncConfig::load(settings);
    REQUIRE(loaded.signaling_port == 47900);
    REQUIRE(loaded.ack_timeout_ms == 5000);
    REQUIRE(loaded.device_role == DeviceRole::Spectator);
}
