#include <QCoreApplication>
#include <QCommandLineParser>
#include <QJsonDocument>
#include <QLoggingCategory>
#include <QSettings>
#include <QSocketNotifier>
#include <QTextStream>

#include <cstdio>
#include <unistd.h>

#include "cli/node_commands.hpp"
#include "controllers/SyncController.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"

namespace {

QTextStream& out() {
    static QTextStream stream(stdout);
    return stream;
}

void print_json(const QJsonObject& obj) {
    out() << QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Indented)) << Qt::flush;
}

void print_error(const rally::Error& error) {
    out() << "error: " << QString::fromStdString(error.message) << Qt::endl;
}

void run_command(rally::controllers::SyncController& controller, const QString& line) {
    using rally::cli::NodeCommandKind;

    auto parsed = rally::cli::parse_node_command(line);
    if (parsed.is_err()) {
        print_error(parsed.unwrap_err());
        return;
    }
    const auto cmd = parsed.unwrap();

    switch (cmd.kind) {
        case NodeCommandKind::Mutate: {
            auto submitted = controller.submitMutation(cmd.collection, cmd.entity_id, cmd.op, cmd.fields);
            if (submitted.is_err()) {
                print_error(submitted.unwrap_err());
            }
            break;
        }
        case NodeCommandKind::Show: {
            const auto entity = controller.entity(cmd.collection, cmd.entity_id);
            if (entity) {
                print_json(*entity);
            } else {
                out() << "no such entity" << Qt::endl;
            }
            break;
        }
        case NodeCommandKind::State:
            print_json(controller.state());
            break;
        case NodeCommandKind::Status:
            print_json(controller.status());
            break;
        case NodeCommandKind::Rooms:
            controller.listAvailableRooms([](auto rooms) {
                if (rooms.is_err()) {
                    print_error(rooms.unwrap_err());
                    return;
                }
                for (const auto& room : rooms.unwrap()) {
                    out() << room.room_id << "  host=" << rally::idString(room.host_id)
                          << "  members=" << room.member_count << Qt::endl;
                }
            });
            break;
        case NodeCommandKind::Leave:
            controller.leaveRoom();
            break;
        case NodeCommandKind::Sync:
            controller.manualSync();
            break;
        case NodeCommandKind::Reconnect:
            controller.forceReconnect();
            break;
        case NodeCommandKind::Clear:
            out() << "dropped " << controller.clearQueue() << " operations" << Qt::endl;
            break;
        case NodeCommandKind::NetworkDown:
            controller.reportNetworkStatus(false);
            break;
        case NodeCommandKind::NetworkUp:
            controller.reportNetworkStatus(true);
            break;
        case NodeCommandKind::Help:
            out() << rally::cli::node_help_text() << Qt::flush;
            break;
        case NodeCommandKind::Quit:
            QCoreApplication::quit();
            break;
    }
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("rally-node");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("Rally");
    app.setOrganizationDomain("rally.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Rally tournament sync node"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption nameOption(
        QStringList{QStringLiteral("name")},
        QStringLiteral("Device display name."),
        QStringLiteral("name"));
    parser.addOption(nameOption);

    const QCommandLineOption roleOption(
        QStringList{QStringLiteral("role")},
        QStringLiteral("Device role: referee, organizer or spectator."),
        QStringLiteral("role"));
    parser.addOption(roleOption);

    const QCommandLineOption relayOption(
        QStringList{QStringLiteral("relay")},
        QStringLiteral("Signaling relay as host:port."),
        QStringLiteral("endpoint"));
    parser.addOption(relayOption);

    const QCommandLineOption createOption(
        QStringList{QStringLiteral("create")},
        QStringLiteral("Create a room and host it."));
    parser.addOption(createOption);

    const QCommandLineOption joinOption(
        QStringList{QStringLiteral("join")},
        QStringLiteral("Join an existing room."),
        QStringLiteral("room"));
    parser.addOption(joinOption);

    const QCommandLineOption listOption(
        QStringList{QStringLiteral("list")},
        QStringLiteral("List open rooms on the relay and exit."));
    parser.addOption(listOption);

    const QCommandLineOption debugOption(
        QStringList{QStringLiteral("debug")},
        QStringLiteral("Enable sync protocol tracing (also sets RALLY_DEBUG_SYNC=1)."));
    parser.addOption(debugOption);

    const QCommandLineOption logFileOption(
        QStringList{QStringLiteral("log-file")},
        QStringLiteral("Write logs to this file instead of the default location."),
        QStringLiteral("path"));
    parser.addOption(logFileOption);

    parser.process(app);

    if (parser.isSet(debugOption)) {
        qputenv("RALLY_DEBUG_SYNC", "1");
    }
    rally::install_file_logging(parser.value(logFileOption));
    qInfo() << "rally-node: logging to"
            << (parser.isSet(logFileOption) ? parser.value(logFileOption) : rally::default_log_file_path());

    QSettings settings;
    auto config = rally::SyncConfig::load(settings);
    if (parser.isSet(nameOption)) {
        config.device_name = parser.value(nameOption);
    }
    if (config.device_name.isEmpty()) {
        config.device_name = QStringLiteral("rally-node");
    }
    if (parser.isSet(roleOption)) {
        const auto role = rally::parseRole(parser.value(roleOption));
        if (!role) {
            QTextStream(stderr) << "unknown role: " << parser.value(roleOption) << Qt::endl;
            return 2;
        }
        config.device_role = *role;
    }
    if (parser.isSet(relayOption)) {
        const auto endpoint = parser.value(relayOption);
        const auto colon = endpoint.lastIndexOf(QLatin1Char(':'));
        bool ok = false;
        const auto port = colon > 0 ? endpoint.mid(colon + 1).toUShort(&ok) : 0;
        if (!ok || port == 0) {
            QTextStream(stderr) << "expected --relay host:port, got " << endpoint << Qt::endl;
            return 2;
        }
        config.signaling_host = endpoint.left(colon);
        config.signaling_port = port;
    }
    if (parser.isSet(debugOption)) {
        config.debug_trace = true;
    }

    rally::controllers::SyncController controller;
    QObject::connect(&controller, &rally::controllers::SyncController::event,
                     [](const QString& name, const QJsonObject& detail) {
                         out() << rally::cli::format_event(name, detail) << Qt::endl;
                     });

    auto initialized = controller.initialize(config);
    if (initialized.is_err()) {
        QTextStream(stderr) << "failed to start: "
                            << QString::fromStdString(initialized.unwrap_err().message) << Qt::endl;
        return 1;
    }
    out() << "device " << controller.deviceId() << " listening on " << controller.listeningPort() << Qt::endl;

    if (parser.isSet(listOption)) {
        controller.listAvailableRooms([](auto rooms) {
            if (rooms.is_err()) {
                print_error(rooms.unwrap_err());
                QCoreApplication::exit(1);
                return;
            }
            for (const auto& room : rooms.unwrap()) {
                out() << room.room_id << "  members=" << room.member_count << Qt::endl;
            }
            QCoreApplication::exit(0);
        });
        return app.exec();
    }

    if (parser.isSet(createOption)) {
        controller.createRoom([](rally::Result<QString, rally::Error> created) {
            if (created.is_err()) {
                print_error(created.unwrap_err());
                QCoreApplication::exit(1);
                return;
            }
            out() << "room " << created.unwrap() << Qt::endl;
        });
    } else if (parser.isSet(joinOption)) {
        controller.joinRoom(parser.value(joinOption), [](rally::Result<void, rally::Error> joined) {
            if (joined.is_err()) {
                print_error(joined.unwrap_err());
                QCoreApplication::exit(1);
            }
        });
    }

    QSocketNotifier input(STDIN_FILENO, QSocketNotifier::Read);
    QTextStream stdin_stream(stdin);
    QObject::connect(&input, &QSocketNotifier::activated, [&]() {
        QString line;
        if (!stdin_stream.readLineInto(&line)) {
            QCoreApplication::quit();
            return;
        }
        if (!line.trimmed().isEmpty()) {
            run_command(controller, line);
        }
    });

    const int rc = app.exec();
    controller.shutdown();
    return rc;
}
