#include "network/transport.hpp"

#include "core/device.hpp"
#include "core/logging.hpp"
#include <QJsonArray>
#include <QJsonDocument>
#include <QMetaObject>
#include <QNetworkInterface>
#include <QPointer>

namespace rally::network {

namespace {

QByteArray to_bytes(const QJsonObject& obj) {
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

std::optional<QJsonObject> parse_object(const QByteArray& bytes) {
    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(bytes, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::nullopt;
    }
    return doc.object();
}

QByteArray hello_payload(const Uuid& device, const QString& token) {
    QJsonObject obj;
    obj["deviceId"] = idString(device);
    obj["token"] = token;
    return to_bytes(obj);
}

} // namespace

// ============================================================================
// HandshakeInfo
// ============================================================================

QJsonObject HandshakeInfo::toJson() const {
    QJsonArray list;
    for (const auto& c : candidates) {
        QJsonObject entry;
        entry["host"] = c.host;
        entry["port"] = int(c.port);
        list.append(entry);
    }
    QJsonObject obj;
    obj["candidates"] = list;
    obj["token"] = token;
    return obj;
}

Result<HandshakeInfo, Error> HandshakeInfo::fromJson(const QJsonObject& obj) {
    using R = Result<HandshakeInfo, Error>;
    HandshakeInfo info;
    info.token = obj.value("token").toString();
    if (info.token.isEmpty()) {
        return R::err(make_error(ErrorCode::ProtocolError, "Handshake without token"));
    }
    for (const auto& v : obj.value("candidates").toArray()) {
        const auto entry = v.toObject();
        const auto host = entry.value("host").toString();
        const int port = entry.value("port").toInt();
        if (host.isEmpty() || port <= 0 || port > 65535) {
            continue;
        }
        info.candidates.push_back(Candidate{host, static_cast<uint16_t>(port)});
    }
    return R::ok(std::move(info));
}

// ============================================================================
// Channel
// ============================================================================

Channel::Channel(QObject* parent)
    : QObject(parent)
{
    connect(&heartbeat_, &QTimer::timeout, this, &Channel::onHeartbeat);
}

Channel::~Channel() {
    heartbeat_.stop();
    if (socket_) {
        socket_->disconnect(this);
        socket_->abort();
    }
}

void Channel::bindSocket() {
    connect(socket_.get(), &QTcpSocket::disconnected,
            this, &Channel::onSocketDisconnected);
    connect(socket_.get(), &QTcpSocket::errorOccurred,
            this, &Channel::onSocketError);
    connect(socket_.get(), &QTcpSocket::readyRead,
            this, &Channel::onReadyRead);
}

void Channel::dial(const Candidate& candidate) {
    if (state_ != State::New) {
        return;
    }
    socket_ = std::make_unique<QTcpSocket>();
    bindSocket();
    connect(socket_.get(), &QTcpSocket::connected,
            this, &Channel::onSocketConnected);

    setState(State::Connecting);
    socket_->connectToHost(candidate.host, candidate.port);
}

void Channel::adopt(QTcpSocket* socket) {
    if (state_ != State::New || !socket) {
        return;
    }
    socket->setParent(nullptr);
    socket_.reset(socket);
    bindSocket();

    setState(State::Connecting);
    since_inbound_.start();
    if (socket_->bytesAvailable() > 0) {
        QMetaObject::invokeMethod(this, &Channel::onReadyRead, Qt::QueuedConnection);
    }
}

Result<void, Error> Channel::send(FrameType type, const QByteArray& payload) {
    const bool handshake_frame = type == FrameType::Hello || type == FrameType::Goodbye;
    const bool usable = state_ == State::Connected ||
                        (state_ == State::Connecting && handshake_frame);
    if (!socket_ || !usable) {
        return Result<void, Error>::err(
            make_error(ErrorCode::NotConnected, "Channel is not connected"));
    }

    const auto frame = encodeFrame(type, payload);
    if (socket_->write(frame) != frame.size()) {
        return Result<void, Error>::err(
            make_error(ErrorCode::NotConnected, socket_->errorString().toStdString()));
    }
    return Result<void, Error>::ok();
}

void Channel::close(const QString& reason) {
    if (state_ == State::Closed) {
        return;
    }
    heartbeat_.stop();
    if (socket_ && (state_ == State::Connected || state_ == State::Connecting) &&
        socket_->state() == QAbstractSocket::ConnectedState) {
        QJsonObject obj;
        obj["reason"] = reason;
        // Best effort: the remote treats a missing goodbye as a lost link.
        if (send(FrameType::Goodbye, to_bytes(obj)).is_ok()) {
            socket_->flush();
        }
        socket_->disconnectFromHost();
    }
    releaseSocket();
    setState(State::Closed);
}

void Channel::abort() {
    if (socket_) {
        socket_->abort();
    }
    loseLink(false);
}

void Channel::markConnected(const Uuid& remote_device) {
    if (state_ != State::Connecting) {
        return;
    }
    remote_device_ = remote_device;
    since_inbound_.restart();
    setState(State::Connected);
    if (heartbeat_interval_ms_ > 0) {
        heartbeat_.start(heartbeat_interval_ms_);
    }
    emit connected();
}

void Channel::setHeartbeat(int interval_ms, int miss_limit) {
    heartbeat_interval_ms_ = interval_ms;
    heartbeat_miss_limit_ = miss_limit > 0 ? miss_limit : 1;
    if (state_ == State::Connected) {
        if (interval_ms > 0) {
            heartbeat_.start(interval_ms);
        } else {
            heartbeat_.stop();
        }
    }
}

QHostAddress Channel::peerAddress() const {
    return socket_ ? socket_->peerAddress() : QHostAddress{};
}

uint16_t Channel::peerPort() const {
    return socket_ ? socket_->peerPort() : 0;
}

void Channel::setState(State state) {
    if (state_ != state) {
        state_ = state;
        emit stateChanged(state);
    }
}

void Channel::loseLink(bool graceful) {
    heartbeat_.stop();
    if (state_ == State::Connecting) {
        setState(State::Failed);
        return;
    }
    if (state_ != State::Connected) {
        return;
    }
    setState(State::Disconnected);
    emit disconnected(graceful);
}

void Channel::failWith(const QString& message) {
    heartbeat_.stop();
    const bool was_connected = state_ == State::Connected;
    emit error(message);
    if (socket_) {
        socket_->abort();
    }
    if (state_ == State::Connected || state_ == State::Connecting) {
        setState(State::Failed);
    }
    if (was_connected) {
        emit disconnected(false);
    }
}

void Channel::releaseSocket() {
    if (!socket_) {
        return;
    }
    socket_->disconnect(this);
    // The socket may be the sender of the signal being handled right now.
    socket_.release()->deleteLater();
}

void Channel::onSocketConnected() {
    since_inbound_.start();
    emit socketConnected();
}

void Channel::onSocketDisconnected() {
    loseLink(false);
}

void Channel::onSocketError(QAbstractSocket::SocketError err) {
    if (err == QAbstractSocket::RemoteHostClosedError && state_ == State::Connected) {
        // disconnected() follows and reports the loss.
        return;
    }
    if (sync_trace_enabled()) {
        qCInfo(rallyTransportLog) << "SYNC: socket error" << err
                                  << (socket_ ? socket_->errorString() : QString{});
    }
    emit error(socket_ ? socket_->errorString() : QStringLiteral("Socket error"));
    loseLink(false);
}

void Channel::onReadyRead() {
    if (!socket_) {
        return;
    }
    reader_.append(socket_->readAll());
    since_inbound_.restart();

    // Handlers may close this channel while frames are still buffered.
    QPointer<Channel> self(this);
    while (self && socket_ && (state_ == State::Connecting || state_ == State::Connected)) {
        auto next = reader_.next();
        if (next.is_err()) {
            failWith(QString::fromStdString(next.unwrap_err().message));
            return;
        }
        auto frame = std::move(next).unwrap();
        if (!frame) {
            return;
        }

        switch (frame->type) {
            case FrameType::Ping:
                if (state_ == State::Connected) {
                    send(FrameType::Pong, {}).inspect_err([](const Error& e) {
                        qCWarning(rallyTransportLog) << "pong failed:" << e.message.c_str();
                    });
                }
                break;
            case FrameType::Pong:
                break;
            case FrameType::Goodbye: {
                const auto obj = parse_object(frame->payload);
                goodbye_reason_ = obj ? obj->value("reason").toString() : QString{};
                if (goodbye_reason_.isEmpty()) {
                    goodbye_reason_ = QStringLiteral("closed");
                }
                if (socket_) {
                    socket_->disconnectFromHost();
                }
                loseLink(true);
                return;
            }
            case FrameType::Hello:
            case FrameType::SyncEnvelope:
                emit frameReceived(frame->type, frame->payload);
                break;
        }
    }
}

void Channel::onHeartbeat() {
    const qint64 budget = qint64(heartbeat_interval_ms_) * heartbeat_miss_limit_;
    if (since_inbound_.isValid() && since_inbound_.elapsed() > budget) {
        qCInfo(rallyTransportLog) << "heartbeat timeout remote="
                                  << idString(remote_device_)
                                  << "silent_ms=" << since_inbound_.elapsed();
        abort();
        return;
    }
    send(FrameType::Ping, {}).inspect_err([](const Error& e) {
        qCWarning(rallyTransportLog) << "ping failed:" << e.message.c_str();
    });
}

// ============================================================================
// TransportListener
// ============================================================================

TransportListener::TransportListener(QObject* parent)
    : QObject(parent)
    , server_(std::make_unique<QTcpServer>())
{
    connect(server_.get(), &QTcpServer::newConnection,
            this, &TransportListener::onNewConnection);
}

TransportListener::~TransportListener() {
    close();
}

Result<uint16_t, Error> TransportListener::listen(uint16_t port) {
    if (server_->isListening()) {
        return Result<uint16_t, Error>::ok(server_->serverPort());
    }
    if (!server_->listen(QHostAddress::Any, port)) {
        return Result<uint16_t, Error>::err(
            make_error(ErrorCode::NotConnected, server_->errorString().toStdString()));
    }
    return Result<uint16_t, Error>::ok(server_->serverPort());
}

void TransportListener::close() {
    server_->close();
}

uint16_t TransportListener::port() const {
    return server_->isListening() ? server_->serverPort() : 0;
}

bool TransportListener::isListening() const {
    return server_->isListening();
}

void TransportListener::onNewConnection() {
    while (server_->hasPendingConnections()) {
        QTcpSocket* socket = server_->nextPendingConnection();
        emit newConnection(socket);
    }
}

// ============================================================================
// TransportManager
// ============================================================================

TransportManager::TransportManager(const Uuid& local_device, QObject* parent)
    : QObject(parent)
    , local_device_(local_device)
    , listener_(std::make_unique<TransportListener>())
{
    connect(listener_.get(), &TransportListener::newConnection,
            this, &TransportManager::onNewConnection);
}

TransportManager::~TransportManager() {
    for (auto& [remote, neg] : negotiations_) {
        if (neg->channel) neg->channel->disconnect(this);
    }
    for (auto& ch : unclaimed_) {
        if (ch) ch->disconnect(this);
    }
    negotiations_.clear();
    unclaimed_.clear();
}

Result<uint16_t, Error> TransportManager::listen(uint16_t port) {
    auto result = listener_->listen(port);
    if (result.is_err() && port != 0) {
        // Fall back to an ephemeral port if the preferred one is taken.
        result = listener_->listen(0);
    }
    if (result.is_ok() && sync_trace_enabled()) {
        qCInfo(rallyTransportLog) << "SYNC: listen port=" << result.unwrap()
                                  << "device_id=" << idString(local_device_);
    }
    return result;
}

void TransportManager::stopListening() {
    listener_->close();
}

uint16_t TransportManager::listeningPort() const {
    return listener_->port();
}

std::vector<Candidate> TransportManager::localCandidates() const {
    std::vector<Candidate> out;
    const auto port = listeningPort();
    if (port == 0) {
        return out;
    }
    for (const auto& addr : QNetworkInterface::allAddresses()) {
        if (addr.protocol() != QAbstractSocket::IPv4Protocol || addr.isLoopback()) {
            continue;
        }
        out.push_back(Candidate{addr.toString(), port});
    }
    // Loopback last: on a real network it would reach our own listener.
    out.push_back(Candidate{QHostAddress(QHostAddress::LocalHost).toString(), port});
    return out;
}

HandshakeInfo TransportManager::prepareHandshake(const Uuid& remote) {
    cancel(remote);

    auto neg = std::make_unique<Negotiation>();
    neg->remote = remote;
    neg->local_token = QString::fromStdString(Uuid::generate().to_string());
    neg->dialer = dialsFirst(local_device_, remote);
    neg->generation = next_generation_++;

    HandshakeInfo info{localCandidates(), neg->local_token};
    if (sync_trace_enabled()) {
        qCInfo(rallyTransportLog) << "SYNC: prepare handshake remote=" << idString(remote)
                                  << "dialer=" << neg->dialer
                                  << "candidates=" << info.candidates.size();
    }
    negotiations_[remote] = std::move(neg);
    return info;
}

void TransportManager::open(const Uuid& remote, const HandshakeInfo& remote_info, OpenCallback done) {
    auto it = negotiations_.find(remote);
    if (it == negotiations_.end()) {
        prepareHandshake(remote);
        it = negotiations_.find(remote);
    }
    auto& neg = *it->second;
    if (neg.opened) {
        if (done) {
            done(OpenResult::err(make_error(ErrorCode::NegotiationFailed,
                                            "Negotiation already in progress")));
        }
        return;
    }

    neg.opened = true;
    neg.done = std::move(done);
    neg.remote_token = remote_info.token;
    neg.candidates = remote_info.candidates;

    const auto generation = neg.generation;
    neg.deadline = std::make_unique<QTimer>();
    neg.deadline->setSingleShot(true);
    neg.deadline->setInterval(options_.negotiation_timeout_ms);
    connect(neg.deadline.get(), &QTimer::timeout, this, [this, remote, generation]() {
        if (find(remote, generation)) {
            finish(remote, OpenResult::err(make_error(ErrorCode::NegotiationTimeout,
                                                      "No usable path to remote device")));
        }
    });
    neg.deadline->start();

    if (neg.dialer) {
        if (neg.candidates.empty()) {
            finish(remote, OpenResult::err(make_error(ErrorCode::NegotiationFailed,
                                                      "Remote offered no candidates")));
            return;
        }
        dialNext(neg);
        return;
    }

    // Accepting side: the dialer may already have arrived.
    if (neg.channel && neg.channel->isConnected()) {
        finish(remote, OpenResult::ok(std::move(neg.channel)));
    }
}

TransportManager::Negotiation* TransportManager::find(const Uuid& remote, uint64_t generation) {
    auto it = negotiations_.find(remote);
    if (it == negotiations_.end() || it->second->generation != generation) {
        return nullptr;
    }
    return it->second.get();
}

void TransportManager::dialNext(Negotiation& neg) {
    const auto remote = neg.remote;
    const auto generation = neg.generation;

    if (neg.next_candidate >= neg.candidates.size()) {
        if (neg.rejected) {
            finish(remote, OpenResult::err(make_error(ErrorCode::NegotiationFailed,
                                                      "Remote rejected the channel")));
            return;
        }
        // Keep cycling through the candidates until the deadline.
        neg.next_candidate = 0;
        QTimer::singleShot(options_.redial_delay_ms, this, [this, remote, generation]() {
            if (auto* n = find(remote, generation)) {
                dialNext(*n);
            }
        });
        return;
    }

    const auto candidate = neg.candidates[neg.next_candidate++];
    auto channel = std::make_unique<Channel>();
    auto* raw = channel.get();

    connect(raw, &Channel::socketConnected, this, [this, raw, remote, generation]() {
        auto* n = find(remote, generation);
        if (!n || n->channel.get() != raw) return;
        auto sent = raw->send(FrameType::Hello, hello_payload(local_device_, n->remote_token));
        if (sent.is_err()) {
            discard(std::move(n->channel), QString{});
            dialNext(*n);
        }
    });
    connect(raw, &Channel::frameReceived, this,
            [this, raw, remote, generation](FrameType type, const QByteArray& payload) {
        auto* n = find(remote, generation);
        if (!n || n->channel.get() != raw || type != FrameType::Hello) return;
        onDialerHello(*n, payload);
    });
    connect(raw, &Channel::stateChanged, this, [this, raw, remote, generation](Channel::State state) {
        if (state != Channel::State::Failed) return;
        auto* n = find(remote, generation);
        if (!n || n->channel.get() != raw) return;
        if (!raw->goodbyeReason().isEmpty()) {
            n->rejected = true;
        }
        discard(std::move(n->channel), QString{});
        dialNext(*n);
    });

    if (sync_trace_enabled()) {
        qCInfo(rallyTransportLog) << "SYNC: dial remote=" << idString(remote)
                                  << "host=" << candidate.host << "port=" << candidate.port;
    }
    neg.channel = std::move(channel);
    raw->dial(candidate);
}

void TransportManager::onDialerHello(Negotiation& neg, const QByteArray& payload) {
    const auto obj = parse_object(payload);
    const auto id = obj ? parseId(obj->value("deviceId").toString()) : std::nullopt;
    const auto token = obj ? obj->value("token").toString() : QString{};

    if (!id || *id != neg.remote || token != neg.remote_token) {
        // Wrong listener behind this candidate; try the next one.
        discard(std::move(neg.channel), QStringLiteral("identity mismatch"));
        dialNext(neg);
        return;
    }

    auto channel = std::move(neg.channel);
    channel->markConnected(neg.remote);
    finish(neg.remote, OpenResult::ok(std::move(channel)));
}

void TransportManager::onNewConnection(QTcpSocket* socket) {
    auto channel = std::make_unique<Channel>();
    auto* raw = channel.get();

    connect(raw, &Channel::frameReceived, this, [this, raw](FrameType type, const QByteArray& payload) {
        if (type == FrameType::Hello) {
            onInboundHello(raw, payload);
        }
    });
    connect(raw, &Channel::stateChanged, this, [this, raw](Channel::State state) {
        if (state == Channel::State::Failed || state == Channel::State::Disconnected) {
            discard(takeUnclaimed(raw), QString{});
        }
    });

    unclaimed_.push_back(std::move(channel));
    raw->adopt(socket);

    // Drop sockets that never introduce themselves.
    QPointer<Channel> guard(raw);
    QTimer::singleShot(options_.negotiation_timeout_ms, this, [this, guard]() {
        if (guard) {
            discard(takeUnclaimed(guard.data()), QStringLiteral("hello timeout"));
        }
    });
}

void TransportManager::onInboundHello(Channel* raw, const QByteArray& payload) {
    auto owned = takeUnclaimed(raw);
    if (!owned) {
        return;
    }

    const auto obj = parse_object(payload);
    const auto id = obj ? parseId(obj->value("deviceId").toString()) : std::nullopt;
    const auto token = obj ? obj->value("token").toString() : QString{};

    auto it = id ? negotiations_.find(*id) : negotiations_.end();
    if (it == negotiations_.end() || it->second->dialer || it->second->local_token != token) {
        if (sync_trace_enabled()) {
            qCInfo(rallyTransportLog) << "SYNC: rejecting inbound channel from"
                                      << raw->peerAddress().toString();
        }
        discard(std::move(owned), QStringLiteral("rejected"));
        return;
    }

    auto& neg = *it->second;
    const auto remote = neg.remote;
    if (owned->send(FrameType::Hello, hello_payload(local_device_, token)).is_err()) {
        discard(std::move(owned), QString{});
        return;
    }
    owned->disconnect(this);
    owned->markConnected(remote);
    if (neg.channel) {
        discard(std::move(neg.channel), QStringLiteral("superseded"));
    }

    if (neg.opened) {
        finish(remote, OpenResult::ok(std::move(owned)));
        return;
    }

    // Arrived before our own open(); hold it until then.
    const auto generation = neg.generation;
    connect(raw, &Channel::stateChanged, this, [this, raw, remote, generation](Channel::State state) {
        if (state != Channel::State::Disconnected && state != Channel::State::Failed) return;
        auto* n = find(remote, generation);
        if (n && n->channel.get() == raw) {
            discard(std::move(n->channel), QString{});
        }
    });
    neg.channel = std::move(owned);
}

void TransportManager::finish(const Uuid& remote, OpenResult result) {
    auto it = negotiations_.find(remote);
    if (it == negotiations_.end()) {
        return;
    }
    auto neg = std::move(it->second);
    negotiations_.erase(it);

    if (neg->deadline) {
        neg->deadline->stop();
        neg->deadline.release()->deleteLater();
    }
    if (neg->channel) {
        discard(std::move(neg->channel), QString{});
    }
    if (result.is_ok()) {
        auto& channel = result.unwrap();
        channel->disconnect(this);
        armChannel(*channel);
    }

    if (sync_trace_enabled()) {
        qCInfo(rallyTransportLog) << "SYNC: negotiation finished remote=" << idString(remote)
                                  << "ok=" << result.is_ok();
    }
    emit negotiationFinished(remote, result.is_ok());
    if (neg->done) {
        neg->done(std::move(result));
    }
}

void TransportManager::cancel(const Uuid& remote) {
    auto it = negotiations_.find(remote);
    if (it == negotiations_.end()) {
        return;
    }
    auto neg = std::move(it->second);
    negotiations_.erase(it);
    if (neg->deadline) {
        neg->deadline->stop();
        neg->deadline.release()->deleteLater();
    }
    if (neg->channel) {
        discard(std::move(neg->channel), QStringLiteral("cancelled"));
    }
}

void TransportManager::cancelAll() {
    std::vector<Uuid> pending;
    pending.reserve(negotiations_.size());
    for (const auto& [remote, neg] : negotiations_) {
        pending.push_back(remote);
    }
    for (const auto& remote : pending) {
        cancel(remote);
    }
    auto unclaimed = std::move(unclaimed_);
    unclaimed_.clear();
    for (auto& ch : unclaimed) {
        discard(std::move(ch), QStringLiteral("cancelled"));
    }
}

Result<void, Error> TransportManager::send(Channel* channel, const QByteArray& payload) {
    if (!channel) {
        return Result<void, Error>::err(make_error(ErrorCode::NotConnected, "No channel"));
    }
    return channel->send(FrameType::SyncEnvelope, payload);
}

void TransportManager::close(ChannelPtr channel, const QString& reason) {
    discard(std::move(channel), reason);
}

bool TransportManager::isNegotiating(const Uuid& remote) const {
    return negotiations_.count(remote) > 0;
}

void TransportManager::discard(ChannelPtr channel, const QString& reason) {
    if (!channel) {
        return;
    }
    channel->disconnect(this);
    channel->close(reason);
    // May be running inside one of the channel's own signals.
    channel.release()->deleteLater();
}

TransportManager::ChannelPtr TransportManager::takeUnclaimed(Channel* channel) {
    for (auto it = unclaimed_.begin(); it != unclaimed_.end(); ++it) {
        if (it->get() == channel) {
            auto owned = std::move(*it);
            unclaimed_.erase(it);
            return owned;
        }
    }
    return nullptr;
}

void TransportManager::armChannel(Channel& channel) const {
    channel.setHeartbeat(options_.heartbeat_interval_ms, options_.heartbeat_miss_limit);
}

} // namespace rally::network
