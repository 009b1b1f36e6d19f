#pragma once

#include "core/device.hpp"
#include "core/result.hpp"
#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include <optional>
#include <vector>

namespace rally::network::signaling {

// Newline-delimited compact JSON, one object per line, keyed by "type".
namespace msg {
inline const QString Register = QStringLiteral("register");
inline const QString Registered = QStringLiteral("registered");
inline const QString CreateRoom = QStringLiteral("create-room");
inline const QString RoomCreated = QStringLiteral("room-created");
inline const QString JoinRoom = QStringLiteral("join-room");
inline const QString RoomRoster = QStringLiteral("room-roster");
inline const QString ListRooms = QStringLiteral("list-rooms");
inline const QString RoomList = QStringLiteral("room-list");
inline const QString Handshake = QStringLiteral("handshake");
inline const QString LeaveRoom = QStringLiteral("leave-room");
inline const QString DeviceJoined = QStringLiteral("device-joined");
inline const QString DeviceLeft = QStringLiteral("device-left");
inline const QString RoomClosed = QStringLiteral("room-closed");
inline const QString ErrorReply = QStringLiteral("error");
} // namespace msg

namespace code {
inline const QString RoomNotFound = QStringLiteral("room-not-found");
inline const QString DeviceNotFound = QStringLiteral("device-not-found");
inline const QString NotRegistered = QStringLiteral("not-registered");
inline const QString AlreadyInRoom = QStringLiteral("already-in-room");
inline const QString BadRequest = QStringLiteral("bad-request");
} // namespace code

struct RoomRoster {
    QString room_id;
    Uuid host_id;
    std::vector<DeviceInfo> members;

    [[nodiscard]] QJsonObject toJson() const;
    [[nodiscard]] static Result<RoomRoster, Error> fromJson(const QJsonObject& obj);
};

struct RoomSummary {
    QString room_id;
    Uuid host_id;
    int member_count = 0;
    Timestamp created_at;
};

[[nodiscard]] QByteArray encodeLine(const QJsonObject& obj);

[[nodiscard]] QJsonObject makeMessage(const QString& type, int request_id = 0);

/**
 * Map a relay error code onto the local taxonomy.
 */
[[nodiscard]] ErrorCode errorCodeFor(const QString& relay_code);

/**
 * LineReader - splits a byte stream into JSON objects.
 *
 * Blank lines are skipped; a line that is not a JSON object yields an
 * error but does not poison the reader.
 */
class LineReader {
public:
    static constexpr int MAX_LINE = 1024 * 1024;

    void append(const QByteArray& bytes) { buffer_.append(bytes); }

    [[nodiscard]] std::optional<Result<QJsonObject, Error>> next();

    [[nodiscard]] bool overflowed() const { return buffer_.size() > MAX_LINE; }

private:
    QByteArray buffer_;
};

} // namespace rally::network::signaling
