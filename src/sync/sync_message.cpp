#include "sync/sync_message.hpp"

#include "core/device.hpp"
#include <QJsonDocument>

namespace rally::sync {

QString messageKindName(MessageKind kind) {
    switch (kind) {
        case MessageKind::Mutation: return QStringLiteral("mutation");
        case MessageKind::SnapshotRequest: return QStringLiteral("snapshot-request");
        case MessageKind::SnapshotResponse: return QStringLiteral("snapshot-response");
        case MessageKind::Ack: return QStringLiteral("ack");
    }
    return QStringLiteral("mutation");
}

std::optional<MessageKind> parseMessageKind(const QString& name) {
    if (name == QLatin1String("mutation")) return MessageKind::Mutation;
    if (name == QLatin1String("snapshot-request")) return MessageKind::SnapshotRequest;
    if (name == QLatin1String("snapshot-response")) return MessageKind::SnapshotResponse;
    if (name == QLatin1String("ack")) return MessageKind::Ack;
    return std::nullopt;
}

QByteArray SyncMessage::encode() const {
    QJsonObject obj;
    obj["senderId"] = idString(sender);
    // JSON numbers are doubles; 2^53 is far beyond any session's sequence.
    obj["sequence"] = static_cast<double>(sequence);
    obj["kind"] = messageKindName(kind);
    obj["timestamp"] = static_cast<double>(timestamp.millis());
    obj["priority"] = priority;
    obj["payload"] = payload;
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

Result<SyncMessage, Error> SyncMessage::decode(const QByteArray& bytes) {
    using R = Result<SyncMessage, Error>;

    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(bytes, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return R::err(make_error(ErrorCode::ProtocolError, "Sync envelope is not a JSON object"));
    }
    const auto obj = doc.object();

    const auto sender = parseId(obj.value("senderId").toString());
    if (!sender) {
        return R::err(make_error(ErrorCode::ProtocolError, "Sync envelope without sender"));
    }
    const auto kind = parseMessageKind(obj.value("kind").toString());
    if (!kind) {
        return R::err(make_error(ErrorCode::ProtocolError,
                                 "Unknown envelope kind: " + obj.value("kind").toString().toStdString()));
    }
    const double sequence = obj.value("sequence").toDouble(-1);
    if (sequence < 0) {
        return R::err(make_error(ErrorCode::ProtocolError, "Sync envelope without sequence"));
    }

    SyncMessage msg;
    msg.sender = *sender;
    msg.sequence = static_cast<uint64_t>(sequence);
    msg.kind = *kind;
    msg.timestamp = Timestamp(static_cast<int64_t>(obj.value("timestamp").toDouble()));
    msg.priority = obj.value("priority").toInt();
    msg.payload = obj.value("payload").toObject();

    if (msg.kind == MessageKind::Mutation && msg.sequence == 0) {
        return R::err(make_error(ErrorCode::ProtocolError, "Mutation sequence starts at 1"));
    }
    return R::ok(std::move(msg));
}

} // namespace rally::sync
