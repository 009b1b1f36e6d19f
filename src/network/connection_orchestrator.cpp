#include "network/connection_orchestrator.hpp"

#include "core/logging.hpp"
#include "network/mesh_policy.hpp"
#include <QMetaObject>
#include <algorithm>

namespace rally::network {

namespace {

const QString kOffer = QStringLiteral("offer");
const QString kAnswer = QStringLiteral("answer");
const QString kReject = QStringLiteral("reject");

QString debug_peer_name(const PeerConnection* peer) {
    if (!peer) {
        return QStringLiteral("<unknown>");
    }
    const auto name = peer->device.name.trimmed();
    return name.isEmpty() ? idString(peer->device.id) : name;
}

} // namespace

QString connectionStatusName(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::New: return QStringLiteral("new");
        case ConnectionStatus::Connecting: return QStringLiteral("connecting");
        case ConnectionStatus::Connected: return QStringLiteral("connected");
        case ConnectionStatus::Disconnected: return QStringLiteral("disconnected");
        case ConnectionStatus::Failed: return QStringLiteral("failed");
        case ConnectionStatus::Closed: return QStringLiteral("closed");
    }
    return QStringLiteral("unknown");
}

ConnectionOrchestrator::ConnectionOrchestrator(const DeviceInfo& self, QObject* parent)
    : QObject(parent)
    , self_(self)
    , signaling_(std::make_unique<SignalingClient>())
    , transport_(std::make_unique<TransportManager>(self.id))
{
    connect(signaling_.get(), &SignalingClient::handshakeReceived,
            this, &ConnectionOrchestrator::onHandshake);
    connect(signaling_.get(), &SignalingClient::handshakeUndeliverable,
            this, &ConnectionOrchestrator::onHandshakeUndeliverable);
    connect(signaling_.get(), &SignalingClient::deviceJoined,
            this, &ConnectionOrchestrator::onSignalingDeviceJoined);
    connect(signaling_.get(), &SignalingClient::deviceLeft,
            this, &ConnectionOrchestrator::onSignalingDeviceLeft);
    connect(signaling_.get(), &SignalingClient::roomClosed,
            this, &ConnectionOrchestrator::onSignalingRoomClosed);
    connect(signaling_.get(), &SignalingClient::connectionLost,
            this, &ConnectionOrchestrator::onSignalingLost);
    connect(signaling_.get(), &SignalingClient::statusChanged,
            this, &ConnectionOrchestrator::statsChanged);
}

ConnectionOrchestrator::~ConnectionOrchestrator() {
    signaling_->disconnect(this);
    transport_->cancelAll();
    for (auto& [id, peer] : peers_) {
        if (peer->channel) {
            peer->channel->disconnect(this);
        }
    }
    peers_.clear();
    pending_rejoin_.reset();
}

void ConnectionOrchestrator::configure(const SyncConfig& config) {
    config_ = config;
    signaling_->setTimeout(config.signaling_timeout_ms);

    TransportManager::Options options;
    options.negotiation_timeout_ms = config.negotiation_timeout_ms;
    options.heartbeat_interval_ms = config.heartbeat_interval_ms;
    options.heartbeat_miss_limit = config.heartbeat_miss_limit;
    transport_->setOptions(options);
}

Result<uint16_t, Error> ConnectionOrchestrator::start(uint16_t port) {
    return transport_->listen(port);
}

void ConnectionOrchestrator::stop() {
    leaveRoom();
    signaling_->disconnectFromRelay();
    transport_->cancelAll();
    transport_->stopListening();
}

void ConnectionOrchestrator::ensureSignaling(DoneCallback done) {
    signaling_->connectToRelay(config_.signaling_host, config_.signaling_port, self_, std::move(done));
}

void ConnectionOrchestrator::createRoom(RoomCallback done) {
    if (room_ || room_request_in_flight_) {
        later([done]() {
            done(Result<QString, Error>::err(
                make_error(ErrorCode::AlreadyInRoom, "Already in a room")));
        });
        return;
    }

    room_request_in_flight_ = true;
    const auto generation = room_generation_;
    ensureSignaling([this, generation, done](Result<void, Error> connected) {
        if (stale(generation)) {
            done(Result<QString, Error>::err(cancelledRequest()));
            return;
        }
        if (connected.is_err()) {
            room_request_in_flight_ = false;
            done(Result<QString, Error>::err(connected.unwrap_err()));
            return;
        }
        signaling_->announceRoom(QString{}, [this, generation, done](Result<QString, Error> created) {
            if (stale(generation)) {
                done(Result<QString, Error>::err(cancelledRequest()));
                return;
            }
            room_request_in_flight_ = false;
            if (created.is_err()) {
                done(std::move(created));
                return;
            }
            const auto room_id = created.unwrap();
            room_ = Room{room_id, self_.id};
            qCInfo(rallyOrchestratorLog) << "created room" << room_id << "as host";
            emit roomCreated(room_id);
            emit statsChanged();
            done(Result<QString, Error>::ok(room_id));
        });
    });
}

void ConnectionOrchestrator::joinRoom(const QString& room_id, DoneCallback done) {
    if (room_ || room_request_in_flight_) {
        later([done]() {
            done(Result<void, Error>::err(make_error(ErrorCode::AlreadyInRoom, "Already in a room")));
        });
        return;
    }
    if (room_id.trimmed().isEmpty()) {
        later([done]() {
            done(Result<void, Error>::err(make_error(ErrorCode::InvalidArgument, "Empty room id")));
        });
        return;
    }

    room_request_in_flight_ = true;
    const auto generation = room_generation_;
    ensureSignaling([this, room_id, generation, done](Result<void, Error> connected) {
        if (stale(generation)) {
            done(Result<void, Error>::err(cancelledRequest()));
            return;
        }
        if (connected.is_err()) {
            room_request_in_flight_ = false;
            done(connected);
            return;
        }
        signaling_->joinRoom(room_id, [this, generation, done](Result<signaling::RoomRoster, Error> roster) {
            if (stale(generation)) {
                done(Result<void, Error>::err(cancelledRequest()));
                return;
            }
            room_request_in_flight_ = false;
            if (roster.is_err()) {
                done(Result<void, Error>::err(roster.unwrap_err()));
                return;
            }
            adoptRoster(roster.unwrap());
            qCInfo(rallyOrchestratorLog) << "joined room" << room_->id
                                         << "members=" << roster.unwrap().members.size();
            emit roomJoined(room_->id);
            emit statsChanged();
            done(Result<void, Error>::ok());
        });
    });
}

void ConnectionOrchestrator::leaveRoom() {
    if (room_request_in_flight_) {
        ++room_generation_;
        room_request_in_flight_ = false;
        if (!room_) {
            // Queued behind the pending request, so the relay undoes it.
            qCInfo(rallyOrchestratorLog) << "abandoned pending room request";
            signaling_->leaveRoom();
            emit statsChanged();
            return;
        }
    }
    if (!room_) {
        return;
    }
    qCInfo(rallyOrchestratorLog) << "leaving room" << room_->id;
    signaling_->leaveRoom();
    teardownRoom(QStringLiteral("left room"));
    emit statsChanged();
}

void ConnectionOrchestrator::rejoin(DoneCallback done) {
    if (!room_) {
        later([done]() {
            done(Result<void, Error>::err(make_error(ErrorCode::NotInRoom, "No room to rejoin")));
        });
        return;
    }
    if (room_request_in_flight_ || pending_rejoin_) {
        later([done]() {
            done(Result<void, Error>::err(
                make_error(ErrorCode::NegotiationFailed, "Rejoin already in progress")));
        });
        return;
    }

    const auto room_id = room_->id;
    room_request_in_flight_ = true;
    const auto generation = room_generation_;
    ensureSignaling([this, room_id, generation, done](Result<void, Error> connected) {
        if (stale(generation)) {
            done(Result<void, Error>::err(cancelledRequest()));
            return;
        }
        if (connected.is_err()) {
            room_request_in_flight_ = false;
            done(connected);
            return;
        }
        signaling_->joinRoom(room_id, [this, room_id, generation, done](Result<signaling::RoomRoster, Error> roster) {
            if (stale(generation)) {
                done(Result<void, Error>::err(cancelledRequest()));
                return;
            }
            room_request_in_flight_ = false;
            if (!room_ || room_->id != room_id) {
                done(Result<void, Error>::err(make_error(ErrorCode::NotInRoom, "Room was left")));
                return;
            }
            if (roster.is_err()) {
                if (roster.unwrap_err().is(ErrorCode::RoomNotFound)) {
                    qCInfo(rallyOrchestratorLog) << "room" << room_id << "no longer exists";
                    endRoom(room_id);
                }
                done(Result<void, Error>::err(roster.unwrap_err()));
                return;
            }

            adoptRoster(roster.unwrap());
            emit statsChanged();
            if (connectedCount() == peers_.size()) {
                done(Result<void, Error>::ok());
                return;
            }

            PendingRejoin pending;
            pending.done = done;
            pending.timer = std::make_unique<QTimer>();
            pending.timer->setSingleShot(true);
            connect(pending.timer.get(), &QTimer::timeout, this, [this]() {
                finishRejoin(Result<void, Error>::err(
                    make_error(ErrorCode::NegotiationTimeout, "No member reachable after rejoin")));
            });
            pending.timer->start(config_.negotiation_timeout_ms);
            pending_rejoin_ = std::move(pending);
        });
    });
}

void ConnectionOrchestrator::listAvailableRooms(RoomsCallback done) {
    ensureSignaling([this, done](Result<void, Error> connected) {
        if (connected.is_err()) {
            done(Result<std::vector<signaling::RoomSummary>, Error>::err(connected.unwrap_err()));
            return;
        }
        signaling_->listRooms(done);
    });
}

void ConnectionOrchestrator::finishRejoin(Result<void, Error> result) {
    if (!pending_rejoin_) {
        return;
    }
    auto pending = std::move(*pending_rejoin_);
    pending_rejoin_.reset();
    if (pending.timer) {
        pending.timer->stop();
        pending.timer.release()->deleteLater();
    }
    if (pending.done) {
        pending.done(std::move(result));
    }
}

void ConnectionOrchestrator::adoptRoster(const signaling::RoomRoster& roster) {
    room_ = Room{roster.room_id, roster.host_id};

    std::vector<Uuid> stale;
    for (const auto& [id, peer] : peers_) {
        const bool listed = std::any_of(roster.members.begin(), roster.members.end(),
                                        [&id](const DeviceInfo& d) { return d.id == id; });
        if (!listed) {
            stale.push_back(id);
        }
    }
    for (const auto& id : stale) {
        dropPeer(id, QStringLiteral("not in roster"));
    }

    for (const auto& member : roster.members) {
        if (member.id == self_.id) {
            continue;
        }
        auto& peer = peerFor(member);
        if (peer.status == ConnectionStatus::Connected || peer.offer_pending ||
            transport_->isNegotiating(member.id)) {
            continue;
        }
        sendOffer(peer);
    }
}

PeerConnection& ConnectionOrchestrator::peerFor(const DeviceInfo& device) {
    auto it = peers_.find(device.id);
    if (it == peers_.end()) {
        auto peer = std::make_unique<PeerConnection>();
        peer->device = device;
        it = peers_.emplace(device.id, std::move(peer)).first;
    } else {
        it->second->device = device;
    }
    it->second->last_seen = Timestamp::now();
    return *it->second;
}

PeerConnection* ConnectionOrchestrator::findPeer(const Uuid& device) {
    auto it = peers_.find(device);
    return it == peers_.end() ? nullptr : it->second.get();
}

void ConnectionOrchestrator::sendOffer(PeerConnection& peer) {
    const auto remote = peer.device.id;
    const auto info = transport_->prepareHandshake(remote);
    peer.offer_pending = true;
    peer.status = ConnectionStatus::Connecting;

    stopOfferTimer(peer);
    peer.offer_timer = std::make_unique<QTimer>();
    peer.offer_timer->setSingleShot(true);
    connect(peer.offer_timer.get(), &QTimer::timeout, this, [this, remote]() {
        auto* p = findPeer(remote);
        if (!p || !p->offer_pending) return;
        stopOfferTimer(*p);
        p->offer_pending = false;
        p->status = ConnectionStatus::Failed;
        transport_->cancel(remote);
        qCWarning(rallyOrchestratorLog) << "no answer from" << debug_peer_name(p);
        emit connectionError(make_error(ErrorCode::NegotiationTimeout,
                                        "No answer from " + debug_peer_name(p).toStdString()));
        emit statsChanged();
    });
    peer.offer_timer->start(config_.negotiation_timeout_ms);

    auto payload = info.toJson();
    payload["kind"] = kOffer;
    if (sync_trace_enabled()) {
        qCInfo(rallyOrchestratorLog) << "SYNC: offer ->" << debug_peer_name(&peer);
    }
    signaling_->exchangeHandshake(remote, payload);
}

void ConnectionOrchestrator::answerOffer(PeerConnection& peer, const QJsonObject& payload) {
    const auto remote = peer.device.id;
    auto remote_info = HandshakeInfo::fromJson(payload);
    if (remote_info.is_err()) {
        sendReject(remote, QStringLiteral("Malformed offer"));
        return;
    }

    stopOfferTimer(peer);
    peer.offer_pending = false;
    const auto info = transport_->prepareHandshake(remote);
    auto answer = info.toJson();
    answer["kind"] = kAnswer;
    if (sync_trace_enabled()) {
        qCInfo(rallyOrchestratorLog) << "SYNC: answer ->" << debug_peer_name(&peer);
    }
    signaling_->exchangeHandshake(remote, answer);
    beginOpen(peer, remote_info.unwrap());
}

void ConnectionOrchestrator::sendReject(const Uuid& target, const QString& reason) {
    QJsonObject payload;
    payload["kind"] = kReject;
    payload["reason"] = reason;
    signaling_->exchangeHandshake(target, payload);
}

void ConnectionOrchestrator::beginOpen(PeerConnection& peer, const HandshakeInfo& remote_info) {
    peer.status = ConnectionStatus::Connecting;
    const auto remote = peer.device.id;
    transport_->open(remote, remote_info, [this, remote](TransportManager::OpenResult result) {
        onChannelOpened(remote, std::move(result));
    });
}

void ConnectionOrchestrator::onHandshake(const Uuid& from, const QJsonObject& payload) {
    const auto kind = payload.value("kind").toString();
    auto* peer = findPeer(from);

    if (kind == kOffer) {
        const auto decision = decide_offer(self_.id, from, room_.has_value(), peer != nullptr,
                                           peer && peer->offer_pending,
                                           peer && peer->status == ConnectionStatus::Connected);
        switch (decision.kind) {
            case OfferDecisionKind::Reject:
                qCInfo(rallyOrchestratorLog) << "rejecting offer from" << idString(from)
                                             << decision.reason;
                sendReject(from, decision.reason);
                return;
            case OfferDecisionKind::IgnoreCollision:
                if (sync_trace_enabled()) {
                    qCInfo(rallyOrchestratorLog) << "SYNC: offer collision with"
                                                 << debug_peer_name(peer) << decision.reason;
                }
                return;
            case OfferDecisionKind::AnswerReplacing:
                if (peer->channel) {
                    peer->channel->disconnect(this);
                    transport_->close(std::move(peer->channel), QStringLiteral("renegotiating"));
                }
                answerOffer(*peer, payload);
                emit statsChanged();
                return;
            case OfferDecisionKind::Answer:
                answerOffer(*peer, payload);
                return;
        }
        return;
    }

    if (!peer || !peer->offer_pending) {
        if (sync_trace_enabled()) {
            qCInfo(rallyOrchestratorLog) << "SYNC: stale" << kind << "from" << idString(from);
        }
        return;
    }

    if (kind == kAnswer) {
        auto remote_info = HandshakeInfo::fromJson(payload);
        stopOfferTimer(*peer);
        peer->offer_pending = false;
        if (remote_info.is_err()) {
            transport_->cancel(from);
            peer->status = ConnectionStatus::Failed;
            emit connectionError(make_error(ErrorCode::NegotiationFailed, remote_info.unwrap_err().message));
            return;
        }
        beginOpen(*peer, remote_info.unwrap());
    } else if (kind == kReject) {
        stopOfferTimer(*peer);
        peer->offer_pending = false;
        peer->status = ConnectionStatus::Failed;
        transport_->cancel(from);
        const auto reason = payload.value("reason").toString();
        qCWarning(rallyOrchestratorLog) << debug_peer_name(peer) << "rejected our offer:" << reason;
        emit connectionError(make_error(ErrorCode::NegotiationFailed,
                                        "Offer rejected: " + reason.toStdString()));
        emit statsChanged();
    }
}

void ConnectionOrchestrator::onHandshakeUndeliverable(const Uuid& target) {
    auto* peer = findPeer(target);
    if (!peer || !peer->offer_pending) {
        return;
    }
    stopOfferTimer(*peer);
    peer->offer_pending = false;
    peer->status = ConnectionStatus::Disconnected;
    transport_->cancel(target);
    qCInfo(rallyOrchestratorLog) << "offer to" << debug_peer_name(peer) << "could not be delivered";
    emit statsChanged();
}

void ConnectionOrchestrator::onChannelOpened(const Uuid& remote, TransportManager::OpenResult result) {
    auto* peer = findPeer(remote);
    if (!peer || !room_) {
        if (result.is_ok()) {
            transport_->close(std::move(result).unwrap(), QStringLiteral("not in room"));
        }
        return;
    }

    if (result.is_err()) {
        peer->status = ConnectionStatus::Failed;
        qCWarning(rallyOrchestratorLog) << "channel to" << debug_peer_name(peer) << "failed:"
                                        << result.unwrap_err().message.c_str();
        emit connectionError(result.unwrap_err());
        emit statsChanged();
        return;
    }

    if (peer->channel) {
        peer->channel->disconnect(this);
        transport_->close(std::move(peer->channel), QStringLiteral("superseded"));
    }
    peer->channel = std::move(result).unwrap();
    Channel* raw = peer->channel.get();

    connect(raw, &Channel::frameReceived, this, [this, remote](FrameType type, const QByteArray& payload) {
        if (type != FrameType::SyncEnvelope) return;
        if (auto* p = findPeer(remote)) {
            p->last_seen = Timestamp::now();
        }
        emit messageReceived(remote, payload);
    });
    connect(raw, &Channel::disconnected, this, [this, remote, raw](bool graceful) {
        onChannelLost(remote, raw, graceful);
    });

    peer->status = ConnectionStatus::Connected;
    peer->last_seen = Timestamp::now();
    const bool first = !peer->announced;
    peer->announced = true;
    qCInfo(rallyOrchestratorLog) << "connected to" << debug_peer_name(peer)
                                 << raw->peerAddress().toString() << raw->peerPort();

    const auto device = peer->device;
    if (first) {
        emit deviceJoined(device);
    }
    emit deviceConnected(device);
    emit statsChanged();
    finishRejoin(Result<void, Error>::ok());
}

void ConnectionOrchestrator::onChannelLost(const Uuid& remote, Channel* channel, bool graceful) {
    auto* peer = findPeer(remote);
    if (!peer || peer->channel.get() != channel) {
        return;
    }
    peer->channel->disconnect(this);
    transport_->close(std::move(peer->channel));
    peer->status = graceful ? ConnectionStatus::Closed : ConnectionStatus::Disconnected;
    qCInfo(rallyOrchestratorLog) << "channel to" << debug_peer_name(peer)
                                 << (graceful ? "closed" : "lost");
    emit deviceDisconnected(remote);

    switch (decide_link_loss(self_.id, remote, graceful, connectedCount())) {
        case LinkLossAction::Renegotiate:
            if (!peer->offer_pending) {
                sendOffer(*peer);
            }
            break;
        case LinkLossAction::ReportConnectivityLost:
            qCWarning(rallyOrchestratorLog) << "no reachable devices left in room" << roomId();
            emit connectivityLost();
            break;
        case LinkLossAction::Forget:
        case LinkLossAction::AwaitOffer:
            break;
    }
    emit statsChanged();
}

void ConnectionOrchestrator::onSignalingDeviceJoined(const DeviceInfo& device) {
    if (!room_ || device.id == self_.id) {
        return;
    }
    peerFor(device);
    if (sync_trace_enabled()) {
        qCInfo(rallyOrchestratorLog) << "SYNC: member announced" << device.name << idString(device.id);
    }
}

void ConnectionOrchestrator::onSignalingDeviceLeft(const Uuid& device_id) {
    if (!room_) {
        return;
    }
    if (device_id == room_->host_id) {
        endRoom(room_->id);
        return;
    }
    dropPeer(device_id, QStringLiteral("left room"));
}

void ConnectionOrchestrator::onSignalingRoomClosed(const QString& room_id) {
    if (room_ && room_->id == room_id) {
        endRoom(room_id);
    }
}

void ConnectionOrchestrator::onSignalingLost() {
    if (room_) {
        qCWarning(rallyOrchestratorLog) << "signaling lost while in room" << room_->id;
        emit connectivityLost();
    }
    emit statsChanged();
}

void ConnectionOrchestrator::stopOfferTimer(PeerConnection& peer) {
    if (peer.offer_timer) {
        peer.offer_timer->stop();
        // May be the timer whose timeout is being handled.
        peer.offer_timer.release()->deleteLater();
    }
}

void ConnectionOrchestrator::dropPeer(const Uuid& device_id, const QString& reason) {
    auto it = peers_.find(device_id);
    if (it == peers_.end()) {
        return;
    }
    auto peer = std::move(it->second);
    peers_.erase(it);

    stopOfferTimer(*peer);
    transport_->cancel(device_id);
    if (peer->channel) {
        peer->channel->disconnect(this);
        transport_->close(std::move(peer->channel), reason);
    }
    qCInfo(rallyOrchestratorLog) << debug_peer_name(peer.get()) << "removed:" << reason;
    if (peer->announced) {
        emit deviceLeft(device_id);
    }
    emit statsChanged();
}

void ConnectionOrchestrator::endRoom(const QString& room_id) {
    qCInfo(rallyOrchestratorLog) << "room ended" << room_id;
    teardownRoom(QStringLiteral("room ended"));
    emit roomEnded(room_id);
    emit statsChanged();
}

void ConnectionOrchestrator::teardownRoom(const QString& reason) {
    transport_->cancelAll();
    for (auto& [id, peer] : peers_) {
        stopOfferTimer(*peer);
        if (peer->channel) {
            peer->channel->disconnect(this);
            transport_->close(std::move(peer->channel), reason);
        }
    }
    peers_.clear();
    room_.reset();
    finishRejoin(Result<void, Error>::err(make_error(ErrorCode::NotInRoom, reason.toStdString())));
}

Result<size_t, Error> ConnectionOrchestrator::broadcast(const QByteArray& payload) {
    if (!room_) {
        return Result<size_t, Error>::err(make_error(ErrorCode::NotInRoom, "Not in a room"));
    }
    size_t delivered = 0;
    for (auto& [id, peer] : peers_) {
        if (peer->status != ConnectionStatus::Connected || !peer->channel) {
            continue;
        }
        auto sent = transport_->send(peer->channel.get(), payload);
        if (sent.is_err()) {
            qCWarning(rallyOrchestratorLog) << "send to" << debug_peer_name(peer.get()) << "failed:"
                                            << sent.unwrap_err().message.c_str();
            continue;
        }
        ++delivered;
    }
    if (sync_trace_enabled()) {
        qCInfo(rallyOrchestratorLog) << "SYNC: broadcast bytes=" << payload.size()
                                     << "devices=" << delivered;
    }
    return Result<size_t, Error>::ok(delivered);
}

Result<void, Error> ConnectionOrchestrator::sendTo(const Uuid& device, const QByteArray& payload) {
    auto* peer = findPeer(device);
    if (!peer || !peer->channel || peer->status != ConnectionStatus::Connected) {
        return Result<void, Error>::err(
            make_error(ErrorCode::NotConnected, "No live channel to " + device.to_string()));
    }
    return transport_->send(peer->channel.get(), payload);
}

ConnectionStats ConnectionOrchestrator::stats() const {
    ConnectionStats out;
    out.connected_device_count = static_cast<int>(connectedCount());
    if (room_) {
        out.room_id = room_->id;
        out.host_device_id = room_->host_id;
        out.is_host = room_->host_id == self_.id;
    }

    bool connecting = false;
    for (const auto& [id, peer] : peers_) {
        if (peer->status == ConnectionStatus::Connecting) {
            connecting = true;
        }
    }
    if (out.connected_device_count > 0) {
        out.connection_status = QStringLiteral("connected");
    } else if (connecting || room_request_in_flight_) {
        out.connection_status = QStringLiteral("connecting");
    } else {
        out.connection_status = QStringLiteral("disconnected");
    }

    switch (signaling_->status()) {
        case SignalingClient::Status::Connected:
            out.signaling_status = QStringLiteral("connected");
            break;
        case SignalingClient::Status::Connecting:
            out.signaling_status = QStringLiteral("connecting");
            break;
        case SignalingClient::Status::Disconnected:
            out.signaling_status = QStringLiteral("disconnected");
            break;
    }
    return out;
}

std::vector<DeviceInfo> ConnectionOrchestrator::knownDevices() const {
    std::vector<DeviceInfo> out;
    out.reserve(peers_.size());
    for (const auto& [id, peer] : peers_) {
        out.push_back(peer->device);
    }
    return out;
}

std::optional<ConnectionStatus> ConnectionOrchestrator::connectionStatus(const Uuid& device) const {
    auto it = peers_.find(device);
    if (it == peers_.end()) {
        return std::nullopt;
    }
    return it->second->status;
}

std::vector<Uuid> ConnectionOrchestrator::connectedDevices() const {
    std::vector<Uuid> out;
    for (const auto& [id, peer] : peers_) {
        if (peer->status == ConnectionStatus::Connected) {
            out.push_back(id);
        }
    }
    return out;
}

std::optional<Uuid> ConnectionOrchestrator::hostDevice() const {
    if (!room_) {
        return std::nullopt;
    }
    return room_->host_id;
}

std::optional<DeviceInfo> ConnectionOrchestrator::device(const Uuid& id) const {
    if (id == self_.id) {
        return self_;
    }
    auto it = peers_.find(id);
    if (it == peers_.end()) {
        return std::nullopt;
    }
    return it->second->device;
}

size_t ConnectionOrchestrator::connectedCount() const {
    size_t count = 0;
    for (const auto& [id, peer] : peers_) {
        if (peer->status == ConnectionStatus::Connected) {
            ++count;
        }
    }
    return count;
}

Error ConnectionOrchestrator::cancelledRequest() {
    return make_error(ErrorCode::NotInRoom, "Room request was cancelled");
}

void ConnectionOrchestrator::later(std::function<void()> fn) {
    QMetaObject::invokeMethod(this, std::move(fn), Qt::QueuedConnection);
}

} // namespace rally::network
