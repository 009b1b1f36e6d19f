#include "network/signaling_protocol.hpp"

#include <QJsonArray>
#include <QJsonDocument>

namespace rally::network::signaling {

QJsonObject RoomRoster::toJson() const {
    QJsonArray list;
    for (const auto& m : members) {
        list.append(m.toJson());
    }
    QJsonObject obj;
    obj["roomId"] = room_id;
    obj["hostId"] = idString(host_id);
    obj["members"] = list;
    return obj;
}

Result<RoomRoster, Error> RoomRoster::fromJson(const QJsonObject& obj) {
    using R = Result<RoomRoster, Error>;
    RoomRoster roster;
    roster.room_id = obj.value("roomId").toString();
    const auto host = parseId(obj.value("hostId").toString());
    if (roster.room_id.isEmpty() || !host) {
        return R::err(make_error(ErrorCode::ProtocolError, "Malformed room roster"));
    }
    roster.host_id = *host;
    for (const auto& v : obj.value("members").toArray()) {
        if (auto device = DeviceInfo::fromJson(v.toObject())) {
            roster.members.push_back(*device);
        }
    }
    return R::ok(std::move(roster));
}

QByteArray encodeLine(const QJsonObject& obj) {
    auto bytes = QJsonDocument(obj).toJson(QJsonDocument::Compact);
    bytes.append('\n');
    return bytes;
}

QJsonObject makeMessage(const QString& type, int request_id) {
    QJsonObject obj;
    obj["type"] = type;
    if (request_id > 0) {
        obj["requestId"] = request_id;
    }
    return obj;
}

ErrorCode errorCodeFor(const QString& relay_code) {
    if (relay_code == code::RoomNotFound) return ErrorCode::RoomNotFound;
    if (relay_code == code::AlreadyInRoom) return ErrorCode::AlreadyInRoom;
    if (relay_code == code::DeviceNotFound) return ErrorCode::NotConnected;
    if (relay_code == code::NotRegistered) return ErrorCode::SignalingUnavailable;
    return ErrorCode::ProtocolError;
}

std::optional<Result<QJsonObject, Error>> LineReader::next() {
    while (true) {
        const auto newline = buffer_.indexOf('\n');
        if (newline < 0) {
            return std::nullopt;
        }
        const auto line = buffer_.left(newline).trimmed();
        buffer_.remove(0, newline + 1);
        if (line.isEmpty()) {
            continue;
        }

        QJsonParseError err{};
        const auto doc = QJsonDocument::fromJson(line, &err);
        if (err.error != QJsonParseError::NoError) {
            return Result<QJsonObject, Error>::err(
                make_error(ErrorCode::ProtocolError, err.errorString().toStdString()));
        }
        if (!doc.isObject()) {
            return Result<QJsonObject, Error>::err(
                make_error(ErrorCode::ProtocolError, "Signaling line is not an object"));
        }
        return Result<QJsonObject, Error>::ok(doc.object());
    }
}

} // namespace rally::network::signaling
