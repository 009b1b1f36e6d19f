#include "network/signaling_client.hpp"

#include "core/logging.hpp"
#include <QJsonArray>
#include <QMetaObject>

namespace rally::network {

using namespace signaling;

namespace {

Error unavailable(const char* message) {
    return make_error(ErrorCode::SignalingUnavailable, message);
}

Result<QJsonObject, Error> as_reply(const QJsonObject& message) {
    if (message.value("type").toString() == msg::ErrorReply) {
        const auto code = message.value("code").toString();
        auto text = message.value("message").toString();
        if (text.isEmpty()) text = code;
        return Result<QJsonObject, Error>::err(make_error(errorCodeFor(code), text.toStdString()));
    }
    return Result<QJsonObject, Error>::ok(message);
}

} // namespace

SignalingClient::SignalingClient(QObject* parent)
    : QObject(parent)
{
}

SignalingClient::~SignalingClient() {
    if (socket_) {
        socket_->disconnect(this);
        socket_->abort();
    }
}

void SignalingClient::setStatus(Status status) {
    if (status_ != status) {
        status_ = status;
        emit statusChanged(status);
    }
}

void SignalingClient::connectToRelay(const QString& host, uint16_t port,
                                     const DeviceInfo& self, DoneCallback done) {
    if (status_ == Status::Connected) {
        QMetaObject::invokeMethod(this, [done = std::move(done)]() {
            done(Result<void, Error>::ok());
        }, Qt::QueuedConnection);
        return;
    }

    connect_waiters_.push_back(std::move(done));
    if (status_ == Status::Connecting) {
        return;
    }

    self_ = self;
    reader_ = LineReader{};
    socket_ = std::make_unique<QTcpSocket>();
    connect(socket_.get(), &QTcpSocket::connected, this, &SignalingClient::onSocketConnected);
    connect(socket_.get(), &QTcpSocket::disconnected, this, &SignalingClient::onSocketDisconnected);
    connect(socket_.get(), &QTcpSocket::errorOccurred, this, &SignalingClient::onSocketError);
    connect(socket_.get(), &QTcpSocket::readyRead, this, &SignalingClient::onReadyRead);

    connect_timer_ = std::make_unique<QTimer>();
    connect_timer_->setSingleShot(true);
    connect_timer_->setInterval(timeout_ms_);
    connect(connect_timer_.get(), &QTimer::timeout, this, [this]() {
        qCWarning(rallySignalingLog) << "relay did not answer within" << timeout_ms_ << "ms";
        tearDown(unavailable("Signaling relay did not answer in time"), false);
    });

    if (sync_trace_enabled()) {
        qCInfo(rallySignalingLog) << "SYNC: connecting to relay" << host << port;
    }
    setStatus(Status::Connecting);
    connect_timer_->start();
    socket_->connectToHost(host, port);
}

void SignalingClient::disconnectFromRelay() {
    if (status_ == Status::Disconnected && !socket_) {
        return;
    }
    tearDown(unavailable("Disconnected from signaling relay"), false);
}

void SignalingClient::announceRoom(const QString& room_id, RoomCallback done) {
    auto message = makeMessage(msg::CreateRoom);
    if (!room_id.isEmpty()) {
        message["roomId"] = room_id;
    }
    request(message, [done = std::move(done)](Result<QJsonObject, Error> reply) {
        if (reply.is_err()) {
            done(Result<QString, Error>::err(reply.unwrap_err()));
            return;
        }
        const auto id = reply.unwrap().value("roomId").toString();
        if (id.isEmpty()) {
            done(Result<QString, Error>::err(
                make_error(ErrorCode::ProtocolError, "Relay confirmed a room without id")));
            return;
        }
        done(Result<QString, Error>::ok(id));
    });
}

void SignalingClient::joinRoom(const QString& room_id, RosterCallback done) {
    auto message = makeMessage(msg::JoinRoom);
    message["roomId"] = room_id;
    request(message, [done = std::move(done)](Result<QJsonObject, Error> reply) {
        done(std::move(reply).and_then([](QJsonObject obj) {
            return RoomRoster::fromJson(obj);
        }));
    });
}

void SignalingClient::listRooms(RoomsCallback done) {
    using R = Result<std::vector<RoomSummary>, Error>;
    request(makeMessage(msg::ListRooms), [done = std::move(done)](Result<QJsonObject, Error> reply) {
        if (reply.is_err()) {
            done(R::err(reply.unwrap_err()));
            return;
        }
        std::vector<RoomSummary> rooms;
        for (const auto& v : reply.unwrap().value("rooms").toArray()) {
            const auto obj = v.toObject();
            RoomSummary summary;
            summary.room_id = obj.value("roomId").toString();
            summary.host_id = parseId(obj.value("hostId").toString()).value_or(Uuid{});
            summary.member_count = obj.value("memberCount").toInt();
            summary.created_at = Timestamp(static_cast<int64_t>(obj.value("createdAt").toDouble()));
            if (!summary.room_id.isEmpty()) {
                rooms.push_back(summary);
            }
        }
        done(R::ok(std::move(rooms)));
    });
}

void SignalingClient::exchangeHandshake(const Uuid& target, const QJsonObject& payload) {
    if (status_ != Status::Connected || !socket_) {
        qCWarning(rallySignalingLog) << "handshake dropped, relay not connected; target="
                                     << idString(target);
        QMetaObject::invokeMethod(this, [this, target]() {
            emit handshakeUndeliverable(target);
        }, Qt::QueuedConnection);
        return;
    }
    auto message = makeMessage(msg::Handshake);
    message["toDevice"] = idString(target);
    message["payload"] = payload;
    if (sync_trace_enabled()) {
        qCInfo(rallySignalingLog) << "SYNC: handshake ->" << idString(target)
                                  << "kind=" << payload.value("kind").toString();
    }
    socket_->write(encodeLine(message));
}

void SignalingClient::leaveRoom() {
    if (status_ != Status::Connected || !socket_) {
        return;
    }
    socket_->write(encodeLine(makeMessage(msg::LeaveRoom)));
    socket_->flush();
}

void SignalingClient::request(QJsonObject message, ReplyHandler handler) {
    if (status_ == Status::Disconnected || !socket_) {
        failLater(std::move(handler), unavailable("Not connected to the signaling relay"));
        return;
    }

    const int id = next_request_++;
    message["requestId"] = id;

    Pending pending;
    pending.handler = std::move(handler);
    pending.timer = std::make_unique<QTimer>();
    pending.timer->setSingleShot(true);
    pending.timer->setInterval(timeout_ms_);
    connect(pending.timer.get(), &QTimer::timeout, this, [this, id]() {
        if (auto handler = takePending(id)) {
            (*handler)(Result<QJsonObject, Error>::err(unavailable("Signaling request timed out")));
        }
    });
    pending.timer->start();
    pending_.emplace(id, std::move(pending));

    socket_->write(encodeLine(message));
}

std::optional<SignalingClient::ReplyHandler> SignalingClient::takePending(int request_id) {
    auto it = pending_.find(request_id);
    if (it == pending_.end()) {
        return std::nullopt;
    }
    auto handler = std::move(it->second.handler);
    if (it->second.timer) {
        it->second.timer->stop();
        // May be the timer whose timeout is being handled.
        it->second.timer.release()->deleteLater();
    }
    pending_.erase(it);
    return handler;
}

void SignalingClient::failLater(ReplyHandler handler, Error error) {
    QMetaObject::invokeMethod(this, [handler = std::move(handler), error = std::move(error)]() {
        handler(Result<QJsonObject, Error>::err(error));
    }, Qt::QueuedConnection);
}

void SignalingClient::finishConnect(const Result<void, Error>& result) {
    auto waiters = std::move(connect_waiters_);
    connect_waiters_.clear();
    for (auto& waiter : waiters) {
        if (waiter) waiter(result);
    }
}

void SignalingClient::tearDown(const Error& reason, bool notify_lost) {
    const bool was_connected = status_ == Status::Connected;

    if (connect_timer_) {
        connect_timer_->stop();
        connect_timer_.release()->deleteLater();
    }
    if (socket_) {
        socket_->disconnect(this);
        socket_->abort();
        socket_.release()->deleteLater();
    }
    reader_ = LineReader{};
    setStatus(Status::Disconnected);

    std::vector<int> ids;
    ids.reserve(pending_.size());
    for (const auto& [id, pending] : pending_) {
        ids.push_back(id);
    }
    finishConnect(Result<void, Error>::err(reason));
    for (const int id : ids) {
        if (auto handler = takePending(id)) {
            (*handler)(Result<QJsonObject, Error>::err(reason));
        }
    }

    if (notify_lost && was_connected) {
        qCWarning(rallySignalingLog) << "relay connection lost:" << reason.message.c_str();
        emit connectionLost();
    }
}

void SignalingClient::onSocketConnected() {
    auto message = makeMessage(msg::Register);
    message["device"] = self_.toJson();
    request(message, [this](Result<QJsonObject, Error> reply) {
        if (reply.is_err()) {
            tearDown(reply.unwrap_err(), false);
            return;
        }
        if (connect_timer_) {
            connect_timer_->stop();
            connect_timer_.release()->deleteLater();
        }
        setStatus(Status::Connected);
        if (sync_trace_enabled()) {
            qCInfo(rallySignalingLog) << "SYNC: registered with relay as" << idString(self_.id);
        }
        finishConnect(Result<void, Error>::ok());
    });
}

void SignalingClient::onSocketDisconnected() {
    tearDown(unavailable("Signaling relay closed the connection"), true);
}

void SignalingClient::onSocketError(QAbstractSocket::SocketError) {
    const auto text = socket_ ? socket_->errorString() : QStringLiteral("socket error");
    tearDown(make_error(ErrorCode::SignalingUnavailable, text.toStdString()), true);
}

void SignalingClient::onReadyRead() {
    if (!socket_) {
        return;
    }
    reader_.append(socket_->readAll());
    if (reader_.overflowed()) {
        tearDown(make_error(ErrorCode::SignalingUnavailable, "Oversized signaling line"), true);
        return;
    }

    while (auto next = reader_.next()) {
        if (next->is_err()) {
            qCWarning(rallySignalingLog) << "bad line from relay:" << next->unwrap_err().message.c_str();
            continue;
        }
        dispatch(next->unwrap());
    }
}

void SignalingClient::dispatch(const QJsonObject& message) {
    const int request_id = message.value("requestId").toInt();
    if (request_id > 0) {
        if (auto handler = takePending(request_id)) {
            (*handler)(as_reply(message));
        }
        return;
    }

    const auto type = message.value("type").toString();
    if (type == msg::DeviceJoined) {
        if (auto device = DeviceInfo::fromJson(message.value("device").toObject())) {
            emit deviceJoined(*device);
        }
    } else if (type == msg::DeviceLeft) {
        if (auto id = parseId(message.value("deviceId").toString())) {
            emit deviceLeft(*id);
        }
    } else if (type == msg::RoomClosed) {
        emit roomClosed(message.value("roomId").toString());
    } else if (type == msg::Handshake) {
        if (auto from = parseId(message.value("fromDevice").toString())) {
            emit handshakeReceived(*from, message.value("payload").toObject());
        }
    } else if (type == msg::ErrorReply) {
        if (auto target = parseId(message.value("toDevice").toString())) {
            emit handshakeUndeliverable(*target);
        } else {
            qCWarning(rallySignalingLog) << "relay error:" << message.value("message").toString();
        }
    } else if (sync_trace_enabled()) {
        qCInfo(rallySignalingLog) << "SYNC: ignoring relay message" << type;
    }
}

} // namespace rally::network
