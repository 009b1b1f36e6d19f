#include <QCoreApplication>
#include <QCommandLineParser>
#include <QHostAddress>
#include <QTextStream>

#include "core/logging.hpp"
#include "network/signaling_relay.hpp"

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("rally-relay");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("Rally");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Rally signaling relay"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption portOption(
        QStringList{QStringLiteral("port")},
        QStringLiteral("TCP port to listen on (default 47900)."),
        QStringLiteral("port"),
        QStringLiteral("47900"));
    parser.addOption(portOption);

    const QCommandLineOption graceOption(
        QStringList{QStringLiteral("host-grace-ms")},
        QStringLiteral("How long a room waits for its host to come back."),
        QStringLiteral("ms"),
        QStringLiteral("30000"));
    parser.addOption(graceOption);

    const QCommandLineOption timeoutOption(
        QStringList{QStringLiteral("room-timeout-ms")},
        QStringLiteral("How long an empty room is kept before it is reaped."),
        QStringLiteral("ms"),
        QStringLiteral("300000"));
    parser.addOption(timeoutOption);

    const QCommandLineOption logFileOption(
        QStringList{QStringLiteral("log-file")},
        QStringLiteral("Write logs to this file instead of the default location."),
        QStringLiteral("path"));
    parser.addOption(logFileOption);

    const QCommandLineOption debugOption(
        QStringList{QStringLiteral("debug")},
        QStringLiteral("Trace every relayed message (also sets RALLY_DEBUG_SYNC=1)."));
    parser.addOption(debugOption);

    parser.process(app);

    bool ok = false;
    const auto port = parser.value(portOption).toUShort(&ok);
    if (!ok) {
        QTextStream(stderr) << "invalid --port: " << parser.value(portOption) << Qt::endl;
        return 2;
    }

    rally::network::SignalingRelay::Options options;
    options.host_grace_ms = parser.value(graceOption).toInt(&ok);
    if (!ok || options.host_grace_ms < 0) {
        QTextStream(stderr) << "invalid --host-grace-ms: " << parser.value(graceOption) << Qt::endl;
        return 2;
    }
    options.room_timeout_ms = parser.value(timeoutOption).toInt(&ok);
    if (!ok || options.room_timeout_ms <= 0) {
        QTextStream(stderr) << "invalid --room-timeout-ms: " << parser.value(timeoutOption) << Qt::endl;
        return 2;
    }

    if (parser.isSet(debugOption)) {
        qputenv("RALLY_DEBUG_SYNC", "1");
    }
    rally::install_file_logging(parser.value(logFileOption));

    rally::network::SignalingRelay relay;
    relay.setOptions(options);
    auto listening = relay.listen(QHostAddress::Any, port);
    if (listening.is_err()) {
        qCritical() << "rally-relay: cannot listen:" << listening.unwrap_err().message.c_str();
        return 1;
    }
    qInfo() << "rally-relay: listening on port" << listening.unwrap();

    return app.exec();
}
