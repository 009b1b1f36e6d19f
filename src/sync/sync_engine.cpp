#include "sync/sync_engine.hpp"

#include "core/logging.hpp"
#include <algorithm>

namespace rally::sync {

SyncEngine::SyncEngine(PeerChannel& peers, QObject* parent)
    : QObject(parent)
    , peers_(peers)
{
}

SyncEngine::~SyncEngine() = default;

void SyncEngine::setOptions(const Options& options) {
    options_ = options;
}

uint64_t SyncEngine::lastApplied(const Uuid& sender) const {
    auto it = last_applied_.find(sender);
    return it == last_applied_.end() ? 0 : it->second;
}

size_t SyncEngine::historySize() const {
    size_t total = 0;
    for (const auto& [sender, log] : history_) {
        total += log.size();
    }
    return total;
}

size_t SyncEngine::bufferedCount(const Uuid& sender) const {
    auto it = buffers_.find(sender);
    return it == buffers_.end() ? 0 : it->second.size();
}

int SyncEngine::localPriority() const {
    return options_.strategy == ConflictStrategy::RolePriority ? rolePriority(options_.role) : 0;
}

int64_t SyncEngine::nextTimestamp() {
    const auto now = Timestamp::now().millis();
    latest_timestamp_ = now > latest_timestamp_ ? now : latest_timestamp_ + 1;
    return latest_timestamp_;
}

SyncMessage SyncEngine::envelope(MessageKind kind, uint64_t sequence) const {
    SyncMessage msg;
    msg.sender = peers_.localDevice();
    msg.sequence = sequence;
    msg.kind = kind;
    msg.timestamp = Timestamp::now();
    msg.priority = localPriority();
    return msg;
}

Result<OutboundMutation, Error> SyncEngine::submit(const Mutation& mutation) {
    auto valid = mutation.validate();
    if (valid.is_err()) {
        return Result<OutboundMutation, Error>::err(valid.unwrap_err());
    }

    const auto sequence = ++local_sequence_;
    auto msg = envelope(MessageKind::Mutation, sequence);
    msg.timestamp = Timestamp(nextTimestamp());
    msg.payload = mutation.toJson();

    const Stamp stamp{msg.priority, msg.timestamp.millis(), msg.sender, sequence};
    replica_.apply(mutation, stamp);
    record(msg.sender, sequence, LoggedMutation{mutation, stamp});

    OutboundMutation out{sequence, mutation.entityRef(), msg.encode()};
    if (sync_trace_enabled()) {
        qCInfo(rallySyncLog) << "SYNC: local mutation seq=" << sequence << out.entity_ref
                             << "auto=" << options_.auto_sync;
    }
    if (options_.auto_sync) {
        emit outboundReady(out);
    } else {
        held_.push_back(out);
    }
    return Result<OutboundMutation, Error>::ok(std::move(out));
}

void SyncEngine::manualSync() {
    if (peers_.inRoom()) {
        if (peers_.isHost()) {
            for (const auto& id : peers_.connectedDevices()) {
                requestSnapshot(id);
            }
        } else if (auto host = peers_.hostDevice()) {
            requestSnapshot(*host);
        }
    }

    auto held = std::move(held_);
    held_.clear();
    qCInfo(rallySyncLog) << "manual sync; releasing" << held.size() << "held mutations";
    for (const auto& out : held) {
        emit outboundReady(out);
    }
}

void SyncEngine::resetSession() {
    for (auto& [sender, resync] : resync_) {
        if (resync.timer) {
            resync.timer->stop();
            resync.timer.release()->deleteLater();
        }
    }
    resync_.clear();
    buffers_.clear();
    last_applied_.clear();
    history_.clear();
}

void SyncEngine::handleEnvelope(const Uuid& from, const QByteArray& bytes) {
    auto decoded = SyncMessage::decode(bytes);
    if (decoded.is_err()) {
        qCWarning(rallySyncLog) << "dropping envelope from" << idString(from) << ":"
                                << decoded.unwrap_err().message.c_str();
        return;
    }
    const auto msg = std::move(decoded).unwrap();
    if (msg.sender != from) {
        qCWarning(rallySyncLog) << "envelope sender" << idString(msg.sender)
                                << "does not match channel" << idString(from);
        return;
    }
    if (sync_trace_enabled()) {
        qCInfo(rallySyncLog) << "SYNC: recv" << messageKindName(msg.kind) << "seq=" << msg.sequence
                             << "from=" << idString(from);
    }

    switch (msg.kind) {
        case MessageKind::Mutation:
            onMutation(msg);
            break;
        case MessageKind::SnapshotRequest:
            onSnapshotRequest(msg);
            break;
        case MessageKind::SnapshotResponse:
            onSnapshotResponse(msg);
            break;
        case MessageKind::Ack:
            // The host applies in order, so its ack covers everything before it.
            if (const auto host = peers_.hostDevice(); host && *host == msg.sender) {
                pruneHistory(peers_.localDevice(), msg.sequence);
            }
            emit ackReceived(msg.sender, msg.sequence);
            break;
    }
}

void SyncEngine::onMutation(const SyncMessage& msg) {
    const auto sender = msg.sender;
    const auto last = lastApplied(sender);

    if (msg.sequence <= last) {
        sendAck(sender, msg.sequence);
        return;
    }
    if (msg.sequence != last + 1) {
        buffers_[sender].emplace(msg.sequence, msg);
        if (resync_.count(sender) == 0) {
            qCInfo(rallySyncLog) << "sequence gap from" << idString(sender) << "expected"
                                 << last + 1 << "got" << msg.sequence;
            startResync(sender);
        }
        return;
    }

    applyRemote(msg);
    sendAck(sender, msg.sequence);
    drainBuffer(sender);
    if (bufferedCount(sender) == 0) {
        // The gap closed on its own.
        stopResync(sender);
    }
}

bool SyncEngine::applyRemote(const SyncMessage& msg) {
    last_applied_[msg.sender] = msg.sequence;
    latest_timestamp_ = std::max(latest_timestamp_, msg.timestamp.millis());

    auto mutation = Mutation::fromJson(msg.payload);
    if (mutation.is_err()) {
        // Skipped so the sender's later mutations are not stuck behind it.
        qCWarning(rallySyncLog) << "unusable mutation seq=" << msg.sequence << "from"
                                << idString(msg.sender) << mutation.unwrap_err().message.c_str();
        emit syncError(mutation.unwrap_err());
        return false;
    }

    const auto& m = mutation.unwrap();
    const Stamp stamp{msg.priority, msg.timestamp.millis(), msg.sender, msg.sequence};
    replica_.apply(m, stamp);
    record(msg.sender, msg.sequence, LoggedMutation{m, stamp});
    emit mutationApplied(m.collection, m.entity_id, msg.sender);
    return true;
}

void SyncEngine::drainBuffer(const Uuid& sender) {
    while (true) {
        auto it = buffers_.find(sender);
        if (it == buffers_.end()) {
            return;
        }
        auto& buffer = it->second;
        if (buffer.empty()) {
            buffers_.erase(it);
            return;
        }

        auto first = buffer.begin();
        const auto last = lastApplied(sender);
        if (first->first <= last) {
            const auto superseded = first->first;
            buffer.erase(first);
            sendAck(sender, superseded);
            continue;
        }
        if (first->first != last + 1) {
            if (resync_.count(sender) == 0) {
                startResync(sender);
            }
            return;
        }

        const auto msg = std::move(first->second);
        buffer.erase(first);
        applyRemote(msg);
        sendAck(sender, msg.sequence);
    }
}

void SyncEngine::requestSnapshot(const Uuid& target) {
    if (sync_trace_enabled()) {
        qCInfo(rallySyncLog) << "SYNC: snapshot-request ->" << idString(target);
    }
    send(target, envelope(MessageKind::SnapshotRequest, 0));
}

void SyncEngine::startResync(const Uuid& sender) {
    auto& resync = resync_[sender];
    resync.attempts = 1;
    resync.timer = std::make_unique<QTimer>();
    resync.timer->setSingleShot(true);
    connect(resync.timer.get(), &QTimer::timeout, this, [this, sender]() {
        onResyncTimeout(sender);
    });
    requestSnapshot(sender);
    resync.timer->start(options_.resync_timeout_ms);
}

void SyncEngine::onResyncTimeout(const Uuid& sender) {
    auto it = resync_.find(sender);
    if (it == resync_.end()) {
        return;
    }
    if (it->second.attempts >= options_.resync_max_attempts) {
        qCWarning(rallySyncLog) << "no snapshot from" << idString(sender) << "after"
                                << it->second.attempts << "requests";
        stopResync(sender);
        emit syncError(make_error(ErrorCode::SequenceGap,
                                  "Could not resynchronize with " + sender.to_string()));
        return;
    }
    ++it->second.attempts;
    requestSnapshot(sender);
    it->second.timer->start(options_.resync_timeout_ms);
}

void SyncEngine::stopResync(const Uuid& sender) {
    auto it = resync_.find(sender);
    if (it == resync_.end()) {
        return;
    }
    if (it->second.timer) {
        it->second.timer->stop();
        // May be the timer whose timeout is being handled.
        it->second.timer.release()->deleteLater();
    }
    resync_.erase(it);
}

void SyncEngine::onSnapshotRequest(const SyncMessage& msg) {
    QJsonObject applied;
    for (const auto& [sender, sequence] : last_applied_) {
        applied[idString(sender)] = static_cast<double>(sequence);
    }
    applied[idString(peers_.localDevice())] = static_cast<double>(local_sequence_);

    auto response = envelope(MessageKind::SnapshotResponse, 0);
    QJsonObject payload;
    payload["state"] = replica_.toJson();
    payload["applied"] = applied;
    response.payload = payload;

    if (sync_trace_enabled()) {
        qCInfo(rallySyncLog) << "SYNC: snapshot-response ->" << idString(msg.sender)
                             << "entities=" << replica_.entityCount();
    }
    send(msg.sender, response);
}

void SyncEngine::onSnapshotResponse(const SyncMessage& msg) {
    auto state = Replica::fromJson(msg.payload.value("state").toObject());
    if (state.is_err()) {
        qCWarning(rallySyncLog) << "malformed snapshot from" << idString(msg.sender)
                                << state.unwrap_err().message.c_str();
        emit syncError(state.unwrap_err());
        return;
    }

    std::map<Uuid, uint64_t> applied;
    const auto clocks = msg.payload.value("applied").toObject();
    for (auto it = clocks.begin(); it != clocks.end(); ++it) {
        if (auto id = parseId(it.key())) {
            applied[*id] = static_cast<uint64_t>(it.value().toDouble());
        }
    }

    const auto host = peers_.hostDevice();
    const bool authoritative = host && *host == msg.sender && !peers_.isHost();
    if (authoritative) {
        replica_ = std::move(state).unwrap();
        // Re-apply what the host has not seen yet.
        for (const auto& [sender, log] : history_) {
            auto seen = applied.find(sender);
            const uint64_t from = seen == applied.end() ? 0 : seen->second;
            for (auto it = log.upper_bound(from); it != log.end(); ++it) {
                replica_.apply(it->second.mutation, it->second.stamp);
            }
        }
        for (const auto& [sender, sequence] : applied) {
            pruneHistory(sender, sequence);
        }
    } else {
        replica_.merge(state.unwrap());
    }

    const auto self = peers_.localDevice();
    for (const auto& [sender, sequence] : applied) {
        if (sender == self) continue;
        auto& last = last_applied_[sender];
        last = std::max(last, sequence);
    }

    qCInfo(rallySyncLog) << "applied snapshot from" << idString(msg.sender)
                         << (authoritative ? "(host)" : "(merged)")
                         << "entities=" << replica_.entityCount();
    stopResync(msg.sender);

    std::vector<Uuid> senders;
    for (const auto& [sender, buffer] : buffers_) {
        senders.push_back(sender);
    }
    for (const auto& sender : senders) {
        drainBuffer(sender);
    }
    emit snapshotApplied(msg.sender);
}

void SyncEngine::handleDeviceConnected(const DeviceInfo& device) {
    const auto host = peers_.hostDevice();
    if (!host || peers_.isHost() || device.id != *host) {
        return;
    }
    requestSnapshot(device.id);
}

void SyncEngine::handleDeviceLeft(const Uuid& device_id) {
    buffers_.erase(device_id);
    stopResync(device_id);
}

void SyncEngine::record(const Uuid& sender, uint64_t sequence, LoggedMutation entry) {
    if (peers_.isHost()) {
        return;
    }
    auto& log = history_[sender];
    log[sequence] = std::move(entry);
    while (log.size() > options_.max_history) {
        log.erase(log.begin());
    }
}

void SyncEngine::pruneHistory(const Uuid& sender, uint64_t through) {
    auto it = history_.find(sender);
    if (it == history_.end()) {
        return;
    }
    auto& log = it->second;
    log.erase(log.begin(), log.upper_bound(through));
    if (log.empty()) {
        history_.erase(it);
    }
}

void SyncEngine::sendAck(const Uuid& to, uint64_t sequence) {
    send(to, envelope(MessageKind::Ack, sequence));
}

void SyncEngine::send(const Uuid& to, const SyncMessage& msg) {
    auto sent = peers_.sendTo(to, msg.encode());
    if (sent.is_err()) {
        qCWarning(rallySyncLog) << "could not send" << messageKindName(msg.kind) << "to"
                                << idString(to) << ":" << sent.unwrap_err().message.c_str();
    }
}

} // namespace rally::sync
