#include "network/signaling_relay.hpp"

#include "core/logging.hpp"
#include <QDateTime>
#include <QJsonArray>
#include <QRandomGenerator>

namespace rally::network {

using namespace signaling;

SignalingRelay::SignalingRelay(QObject* parent)
    : QObject(parent)
    , server_(std::make_unique<QTcpServer>())
{
    connect(server_.get(), &QTcpServer::newConnection,
            this, &SignalingRelay::onNewConnection);
    connect(&reaper_, &QTimer::timeout, this, &SignalingRelay::reapIdleRooms);
}

SignalingRelay::~SignalingRelay() {
    close();
}

void SignalingRelay::setOptions(const Options& options) {
    options_ = options;
    if (reaper_.isActive()) {
        reaper_.start(options_.reap_interval_ms);
    }
}

Result<uint16_t, Error> SignalingRelay::listen(const QHostAddress& address, uint16_t port) {
    if (!server_->listen(address, port)) {
        return Result<uint16_t, Error>::err(
            make_error(ErrorCode::SignalingUnavailable, server_->errorString().toStdString()));
    }
    reaper_.start(options_.reap_interval_ms);
    qCInfo(rallyRelayLog) << "relay listening on" << address.toString() << server_->serverPort();
    return Result<uint16_t, Error>::ok(server_->serverPort());
}

void SignalingRelay::close() {
    reaper_.stop();
    server_->close();
    auto sessions = std::move(sessions_);
    sessions_.clear();
    for (auto& [socket, session] : sessions) {
        socket->disconnect(this);
        socket->abort();
        socket->deleteLater();
    }
    by_device_.clear();
    for (auto& [id, room] : rooms_) {
        if (room->grace) {
            room->grace->stop();
            room->grace.release()->deleteLater();
        }
    }
    rooms_.clear();
}

uint16_t SignalingRelay::port() const {
    return server_->isListening() ? server_->serverPort() : 0;
}

std::vector<RoomSummary> SignalingRelay::rooms() const {
    std::vector<RoomSummary> out;
    out.reserve(rooms_.size());
    for (const auto& [id, room] : rooms_) {
        out.push_back(RoomSummary{id, room->host_id, static_cast<int>(room->members.size()),
                                  room->created_at});
    }
    return out;
}

std::vector<Uuid> SignalingRelay::members(const QString& room_id) const {
    std::vector<Uuid> out;
    auto it = rooms_.find(room_id);
    if (it == rooms_.end()) {
        return out;
    }
    for (const auto& [id, device] : it->second->members) {
        out.push_back(id);
    }
    return out;
}

QString SignalingRelay::generateRoomId() {
    static const char alphabet[] = "abcdefghijklmnopqrstuvwxyz0123456789";
    QString suffix;
    for (int i = 0; i < 6; ++i) {
        suffix.append(QChar(alphabet[QRandomGenerator::global()->bounded(36)]));
    }
    return QStringLiteral("room-%1-%2").arg(QDateTime::currentMSecsSinceEpoch()).arg(suffix);
}

void SignalingRelay::onNewConnection() {
    while (server_->hasPendingConnections()) {
        QTcpSocket* socket = server_->nextPendingConnection();
        auto session = std::make_unique<Session>();
        session->socket = socket;
        sessions_[socket] = std::move(session);

        connect(socket, &QTcpSocket::readyRead, this, [this, socket]() { onReadyRead(socket); });
        connect(socket, &QTcpSocket::disconnected, this, [this, socket]() { onSessionClosed(socket); });
    }
}

void SignalingRelay::onReadyRead(QTcpSocket* socket) {
    auto it = sessions_.find(socket);
    if (it == sessions_.end()) {
        return;
    }
    auto& session = *it->second;
    session.reader.append(socket->readAll());
    if (session.reader.overflowed()) {
        qCWarning(rallyRelayLog) << "dropping session with oversized line";
        socket->abort();
        return;
    }
    while (auto next = session.reader.next()) {
        if (next->is_err()) {
            replyError(session, code::BadRequest,
                       QString::fromStdString(next->unwrap_err().message), 0);
            continue;
        }
        handle(session, next->unwrap());
        // A handler may have closed this session.
        if (sessions_.find(socket) == sessions_.end()) {
            return;
        }
    }
}

void SignalingRelay::onSessionClosed(QTcpSocket* socket) {
    auto it = sessions_.find(socket);
    if (it == sessions_.end()) {
        return;
    }
    auto session = std::move(it->second);
    sessions_.erase(it);
    socket->deleteLater();

    if (!session->device) {
        return;
    }
    const auto device_id = session->device->id;
    auto owner = by_device_.find(device_id);
    if (owner == by_device_.end() || owner->second != socket) {
        // Superseded by a newer registration of the same device.
        return;
    }
    by_device_.erase(owner);

    auto room_it = rooms_.find(session->room_id);
    if (room_it == rooms_.end()) {
        return;
    }
    auto& room = *room_it->second;
    if (room.host_id == device_id) {
        qCInfo(rallyRelayLog) << "host session lost; holding room" << room.id
                              << "for" << options_.host_grace_ms << "ms";
        startHostGrace(room);
        return;
    }
    room.members.erase(device_id);
    QJsonObject left = makeMessage(msg::DeviceLeft);
    left["deviceId"] = idString(device_id);
    broadcastToRoom(room, left, device_id);
}

void SignalingRelay::handle(Session& session, const QJsonObject& message) {
    const auto type = message.value("type").toString();
    const int request_id = message.value("requestId").toInt();

    if (type == msg::Register) {
        handleRegister(session, message, request_id);
        return;
    }
    if (!session.device) {
        replyError(session, code::NotRegistered, QStringLiteral("Register first"), request_id);
        return;
    }

    if (type == msg::CreateRoom) {
        handleCreateRoom(session, message, request_id);
    } else if (type == msg::JoinRoom) {
        handleJoinRoom(session, message, request_id);
    } else if (type == msg::ListRooms) {
        handleListRooms(session, request_id);
    } else if (type == msg::Handshake) {
        handleHandshake(session, message);
    } else if (type == msg::LeaveRoom) {
        handleLeaveRoom(session);
    } else {
        replyError(session, code::BadRequest, QStringLiteral("Unknown message type"), request_id);
    }
}

void SignalingRelay::handleRegister(Session& session, const QJsonObject& message, int request_id) {
    auto device = DeviceInfo::fromJson(message.value("device").toObject());
    if (!device) {
        replyError(session, code::BadRequest, QStringLiteral("Malformed device"), request_id);
        return;
    }

    auto previous = by_device_.find(device->id);
    if (previous != by_device_.end() && previous->second != session.socket) {
        auto old = sessions_.find(previous->second);
        if (old != sessions_.end()) {
            qCInfo(rallyRelayLog) << "device re-registered; dropping old session" << idString(device->id);
            old->second->device.reset();
            old->second->socket->abort();
        }
    }
    by_device_[device->id] = session.socket;
    session.device = *device;

    reply(session, makeMessage(msg::Registered), request_id);
}

void SignalingRelay::handleCreateRoom(Session& session, const QJsonObject& message, int request_id) {
    if (!session.room_id.isEmpty() && rooms_.count(session.room_id) > 0) {
        replyError(session, code::AlreadyInRoom, QStringLiteral("Leave the current room first"), request_id);
        return;
    }
    auto room_id = message.value("roomId").toString();
    if (room_id.isEmpty()) {
        room_id = generateRoomId();
    }
    if (rooms_.count(room_id) > 0) {
        replyError(session, code::AlreadyInRoom, QStringLiteral("Room id already taken"), request_id);
        return;
    }

    auto room = std::make_unique<Room>();
    room->id = room_id;
    room->host_id = session.device->id;
    room->members[session.device->id] = *session.device;
    room->created_at = Timestamp::now();
    rooms_[room_id] = std::move(room);
    session.room_id = room_id;

    qCInfo(rallyRelayLog) << "room created" << room_id << "host=" << idString(session.device->id);
    QJsonObject created = makeMessage(msg::RoomCreated);
    created["roomId"] = room_id;
    reply(session, created, request_id);
    emit roomOpened(room_id);
}

void SignalingRelay::handleJoinRoom(Session& session, const QJsonObject& message, int request_id) {
    const auto room_id = message.value("roomId").toString();
    auto it = rooms_.find(room_id);
    if (it == rooms_.end()) {
        replyError(session, code::RoomNotFound,
                   QStringLiteral("Unknown room %1").arg(room_id), request_id);
        return;
    }
    if (!session.room_id.isEmpty() && session.room_id != room_id) {
        leaveCurrentRoom(session);
        it = rooms_.find(room_id);
        if (it == rooms_.end()) {
            replyError(session, code::RoomNotFound,
                       QStringLiteral("Unknown room %1").arg(room_id), request_id);
            return;
        }
    }

    auto& room = *it->second;
    const auto& device = *session.device;
    if (room.host_id == device.id && room.host_away) {
        qCInfo(rallyRelayLog) << "host returned to room" << room.id;
        room.host_away = false;
        if (room.grace) {
            room.grace->stop();
            room.grace.release()->deleteLater();
        }
    }
    room.members[device.id] = device;
    room.idle_since_ms = 0;
    session.room_id = room_id;

    RoomRoster roster;
    roster.room_id = room.id;
    roster.host_id = room.host_id;
    for (const auto& [id, member] : room.members) {
        roster.members.push_back(member);
    }
    auto rosterMessage = roster.toJson();
    rosterMessage["type"] = msg::RoomRoster;
    reply(session, rosterMessage, request_id);

    QJsonObject joined = makeMessage(msg::DeviceJoined);
    joined["device"] = device.toJson();
    broadcastToRoom(room, joined, device.id);
}

void SignalingRelay::handleListRooms(Session& session, int request_id) {
    QJsonArray list;
    for (const auto& summary : rooms()) {
        QJsonObject entry;
        entry["roomId"] = summary.room_id;
        entry["hostId"] = idString(summary.host_id);
        entry["memberCount"] = summary.member_count;
        entry["createdAt"] = static_cast<double>(summary.created_at.millis());
        list.append(entry);
    }
    QJsonObject out = makeMessage(msg::RoomList);
    out["rooms"] = list;
    reply(session, out, request_id);
}

void SignalingRelay::handleHandshake(Session& session, const QJsonObject& message) {
    const auto target = parseId(message.value("toDevice").toString());
    if (!target || !sessionFor(*target)) {
        QJsonObject err = makeMessage(msg::ErrorReply);
        err["code"] = code::DeviceNotFound;
        err["message"] = QStringLiteral("Target device is not connected");
        err["toDevice"] = message.value("toDevice").toString();
        session.socket->write(encodeLine(err));
        return;
    }
    QJsonObject forward = makeMessage(msg::Handshake);
    forward["fromDevice"] = idString(session.device->id);
    forward["toDevice"] = idString(*target);
    forward["payload"] = message.value("payload").toObject();
    sendToDevice(*target, forward);
}

void SignalingRelay::handleLeaveRoom(Session& session) {
    leaveCurrentRoom(session);
}

void SignalingRelay::leaveCurrentRoom(Session& session) {
    const auto room_id = session.room_id;
    session.room_id.clear();
    auto it = rooms_.find(room_id);
    if (it == rooms_.end() || !session.device) {
        return;
    }
    auto& room = *it->second;
    const auto device_id = session.device->id;
    if (room.host_id == device_id) {
        qCInfo(rallyRelayLog) << "host left; closing room" << room_id;
        closeRoom(room_id);
        return;
    }
    room.members.erase(device_id);
    QJsonObject left = makeMessage(msg::DeviceLeft);
    left["deviceId"] = idString(device_id);
    broadcastToRoom(room, left, device_id);
}

void SignalingRelay::closeRoom(const QString& room_id) {
    auto it = rooms_.find(room_id);
    if (it == rooms_.end()) {
        return;
    }
    auto room = std::move(it->second);
    rooms_.erase(it);
    if (room->grace) {
        room->grace->stop();
        room->grace.release()->deleteLater();
    }

    QJsonObject closed = makeMessage(msg::RoomClosed);
    closed["roomId"] = room_id;
    for (const auto& [id, member] : room->members) {
        if (auto* session = sessionFor(id)) {
            if (session->room_id == room_id) {
                session->room_id.clear();
            }
            if (id != room->host_id) {
                session->socket->write(encodeLine(closed));
            }
        }
    }
    emit roomClosed(room_id);
}

void SignalingRelay::startHostGrace(Room& room) {
    room.host_away = true;
    room.grace = std::make_unique<QTimer>();
    room.grace->setSingleShot(true);
    const auto room_id = room.id;
    connect(room.grace.get(), &QTimer::timeout, this, [this, room_id]() {
        auto it = rooms_.find(room_id);
        if (it != rooms_.end() && it->second->host_away) {
            qCInfo(rallyRelayLog) << "host did not return; closing room" << room_id;
            closeRoom(room_id);
        }
    });
    room.grace->start(options_.host_grace_ms);
}

void SignalingRelay::reapIdleRooms() {
    const qint64 now = QDateTime::currentMSecsSinceEpoch();
    std::vector<QString> expired;
    for (auto& [id, room] : rooms_) {
        bool live = false;
        for (const auto& [member_id, member] : room->members) {
            if (by_device_.count(member_id) > 0) {
                live = true;
                break;
            }
        }
        if (live) {
            room->idle_since_ms = 0;
            continue;
        }
        if (room->idle_since_ms == 0) {
            room->idle_since_ms = now;
        } else if (now - room->idle_since_ms >= options_.room_timeout_ms) {
            expired.push_back(id);
        }
    }
    for (const auto& id : expired) {
        qCInfo(rallyRelayLog) << "reaping idle room" << id;
        closeRoom(id);
    }
}

void SignalingRelay::reply(Session& session, QJsonObject message, int request_id) {
    if (request_id > 0) {
        message["requestId"] = request_id;
    }
    session.socket->write(encodeLine(message));
}

void SignalingRelay::replyError(Session& session, const QString& error_code,
                                const QString& text, int request_id) {
    QJsonObject err = makeMessage(msg::ErrorReply);
    err["code"] = error_code;
    err["message"] = text;
    reply(session, err, request_id);
}

void SignalingRelay::sendToDevice(const Uuid& device, const QJsonObject& message) {
    if (auto* session = sessionFor(device)) {
        session->socket->write(encodeLine(message));
    }
}

void SignalingRelay::broadcastToRoom(const Room& room, const QJsonObject& message, const Uuid& except) {
    const auto line = encodeLine(message);
    for (const auto& [id, member] : room.members) {
        if (id == except) continue;
        if (auto* session = sessionFor(id)) {
            session->socket->write(line);
        }
    }
}

SignalingRelay::Session* SignalingRelay::sessionFor(const Uuid& device) {
    auto it = by_device_.find(device);
    if (it == by_device_.end()) {
        return nullptr;
    }
    auto session = sessions_.find(it->second);
    return session == sessions_.end() ? nullptr : session->second.get();
}

} // namespace rally::network
