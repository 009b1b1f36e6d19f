#include "cli/node_commands.hpp"

#include <QJsonDocument>
#include <QJsonValue>
#include <QRegularExpression>
#include <QStringList>

namespace rally::cli {

namespace {

Result<NodeCommand> usage_error(const QString& message) {
    return Result<NodeCommand>::err(make_error(ErrorCode::InvalidArgument, message.toStdString()));
}

QJsonValue parse_value(const QString& text) {
    if (text == QStringLiteral("true")) return true;
    if (text == QStringLiteral("false")) return false;
    if (text == QStringLiteral("null")) return QJsonValue(QJsonValue::Null);
    bool ok = false;
    const double number = text.toDouble(&ok);
    if (ok) return number;
    return text;
}

Result<QJsonObject> parse_fields(const QStringList& words) {
    QJsonObject fields;
    for (const auto& word : words) {
        const auto eq = word.indexOf(QLatin1Char('='));
        if (eq <= 0) {
            return Result<QJsonObject>::err(
                make_error(ErrorCode::InvalidArgument, "Expected field=value, got '" + word.toStdString() + "'"));
        }
        fields[word.left(eq)] = parse_value(word.mid(eq + 1));
    }
    return Result<QJsonObject>::ok(std::move(fields));
}

} // namespace

Result<NodeCommand> parse_node_command(const QString& line) {
    static const QRegularExpression whitespace(QStringLiteral("\\s+"));
    const auto words = line.trimmed().split(whitespace, Qt::SkipEmptyParts);
    if (words.isEmpty()) {
        return usage_error(QStringLiteral("Empty command"));
    }

    const auto verb = words.first().toLower();
    NodeCommand cmd;

    if (verb == QStringLiteral("create") || verb == QStringLiteral("set") || verb == QStringLiteral("delete")) {
        if (words.size() < 3) {
            return usage_error(verb + QStringLiteral(" needs <collection> <id>"));
        }
        cmd.kind = NodeCommandKind::Mutate;
        cmd.collection = words.at(1);
        cmd.entity_id = words.at(2);
        cmd.op = *sync::parseMutationOp(verb == QStringLiteral("set") ? QStringLiteral("update") : verb);

        const auto rest = words.mid(3);
        if (cmd.op == sync::MutationOp::Delete && !rest.isEmpty()) {
            return usage_error(QStringLiteral("delete takes no fields"));
        }
        auto fields = parse_fields(rest);
        if (fields.is_err()) {
            return Result<NodeCommand>::err(fields.unwrap_err());
        }
        cmd.fields = fields.unwrap();
        if (cmd.op == sync::MutationOp::Update && cmd.fields.isEmpty()) {
            return usage_error(QStringLiteral("set needs at least one field=value"));
        }
        return Result<NodeCommand>::ok(std::move(cmd));
    }

    if (verb == QStringLiteral("show")) {
        if (words.size() != 3) {
            return usage_error(QStringLiteral("show needs <collection> <id>"));
        }
        cmd.kind = NodeCommandKind::Show;
        cmd.collection = words.at(1);
        cmd.entity_id = words.at(2);
        return Result<NodeCommand>::ok(std::move(cmd));
    }

    static const std::pair<const char*, NodeCommandKind> simple[] = {
        {"state", NodeCommandKind::State},
        {"status", NodeCommandKind::Status},
        {"rooms", NodeCommandKind::Rooms},
        {"leave", NodeCommandKind::Leave},
        {"sync", NodeCommandKind::Sync},
        {"reconnect", NodeCommandKind::Reconnect},
        {"clear", NodeCommandKind::Clear},
        {"offline", NodeCommandKind::NetworkDown},
        {"online", NodeCommandKind::NetworkUp},
        {"help", NodeCommandKind::Help},
        {"quit", NodeCommandKind::Quit},
        {"exit", NodeCommandKind::Quit},
    };
    for (const auto& [name, kind] : simple) {
        if (verb == QLatin1String(name)) {
            if (words.size() != 1) {
                return usage_error(verb + QStringLiteral(" takes no arguments"));
            }
            cmd.kind = kind;
            return Result<NodeCommand>::ok(std::move(cmd));
        }
    }
    return usage_error(QStringLiteral("Unknown command '%1' (try help)").arg(verb));
}

QString node_help_text() {
    return QStringLiteral(
        "create <collection> <id> [field=value ...]\n"
        "set <collection> <id> field=value [...]\n"
        "delete <collection> <id>\n"
        "show <collection> <id>\n"
        "state      print the replicated state\n"
        "status     print connection, queue and reconnection status\n"
        "rooms      list rooms on the relay\n"
        "leave      leave the current room\n"
        "sync       request a snapshot and send held mutations\n"
        "reconnect  force a reconnection attempt\n"
        "clear      drop every queued operation\n"
        "offline    simulate the network going down\n"
        "online     simulate the network coming back\n"
        "quit\n");
}

QString format_event(const QString& name, const QJsonObject& detail) {
    if (detail.isEmpty()) {
        return QStringLiteral("[%1]").arg(name);
    }
    return QStringLiteral("[%1] %2").arg(name, QString::fromUtf8(QJsonDocument(detail).toJson(QJsonDocument::Compact)));
}

} // namespace rally::cli
