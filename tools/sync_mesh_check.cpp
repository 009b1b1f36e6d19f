#include <QCoreApplication>
#include <QEventLoop>
#include <QHostAddress>
#include <QTimer>

#include <functional>

#include "controllers/SyncController.hpp"
#include "network/signaling_relay.hpp"

// Smoke check: one relay and three nodes on localhost form a full mesh and
// converge on a mutation made by a non-host.

namespace {

bool wait_until(const std::function<bool()>& done, int timeout_ms) {
    QEventLoop loop;
    QTimer timeout;
    timeout.setSingleShot(true);
    timeout.setInterval(timeout_ms);
    QObject::connect(&timeout, &QTimer::timeout, &loop, &QEventLoop::quit);

    QTimer poll;
    poll.setInterval(20);
    QObject::connect(&poll, &QTimer::timeout, &loop, [&]() {
        if (done()) {
            loop.quit();
        }
    });

    timeout.start();
    poll.start();
    loop.exec();
    return done();
}

rally::SyncConfig node_config(const QString& name, uint16_t relay_port) {
    rally::SyncConfig config;
    config.device_name = name;
    config.signaling_port = relay_port;
    config.negotiation_timeout_ms = 3000;
    return config;
}

} // namespace

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);

    qputenv("RALLY_DEBUG_SYNC", "1");

    rally::network::SignalingRelay relay;
    auto listening = relay.listen(QHostAddress::LocalHost, 0);
    if (listening.is_err()) {
        return 1;
    }
    const auto relay_port = listening.unwrap();

    rally::controllers::SyncController a;
    rally::controllers::SyncController b;
    rally::controllers::SyncController c;
    if (a.initialize(node_config(QStringLiteral("A"), relay_port)).is_err() ||
        b.initialize(node_config(QStringLiteral("B"), relay_port)).is_err() ||
        c.initialize(node_config(QStringLiteral("C"), relay_port)).is_err()) {
        return 1;
    }

    QString room;
    a.createRoom([&](rally::Result<QString, rally::Error> created) {
        if (created.is_ok()) {
            room = created.unwrap();
        }
    });
    if (!wait_until([&]() { return !room.isEmpty(); }, 3000)) {
        return 2;
    }

    b.joinRoom(room);
    if (!wait_until([&]() { return a.connectedDeviceCount() == 1; }, 5000)) {
        return 3;
    }
    c.joinRoom(room);
    const auto meshed = [&]() {
        return a.connectedDeviceCount() == 2 && b.connectedDeviceCount() == 2 && c.connectedDeviceCount() == 2;
    };
    if (!wait_until(meshed, 5000)) {
        return 4;
    }

    auto submitted = b.submitMutation(QStringLiteral("matches"), QStringLiteral("m1"),
                                      rally::sync::MutationOp::Create,
                                      QJsonObject{{"court", 3}, {"status", "scheduled"}});
    if (submitted.is_err()) {
        return 5;
    }
    const auto converged = [&]() {
        return a.entity(QStringLiteral("matches"), QStringLiteral("m1")).has_value() &&
               c.entity(QStringLiteral("matches"), QStringLiteral("m1")).has_value();
    };
    if (!wait_until(converged, 3000)) {
        return 6;
    }
    return a.state() == c.state() && a.state() == b.state() ? 0 : 7;
}
