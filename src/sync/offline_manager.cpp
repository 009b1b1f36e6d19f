#include "sync/offline_manager.hpp"

#include "core/logging.hpp"
#include "sync/reconnection_policy.hpp"
#include <QPointer>

namespace rally::sync {

QString connectivityPhaseName(ConnectivityPhase phase) {
    switch (phase) {
        case ConnectivityPhase::Online: return QStringLiteral("online");
        case ConnectivityPhase::Offline: return QStringLiteral("offline");
        case ConnectivityPhase::Reconnecting: return QStringLiteral("reconnecting");
        case ConnectivityPhase::Failed: return QStringLiteral("failed");
    }
    return QStringLiteral("online");
}

OfflineManager::OfflineManager(PeerChannel& peers, Reconnector& reconnector, QObject* parent)
    : QObject(parent)
    , peers_(peers)
    , reconnector_(reconnector)
{
    ack_timer_.setSingleShot(true);
    backoff_timer_.setSingleShot(true);
    connect(&ack_timer_, &QTimer::timeout, this, &OfflineManager::onAckTimeout);
    connect(&backoff_timer_, &QTimer::timeout, this, &OfflineManager::attempt);
}

OfflineManager::~OfflineManager() = default;

void OfflineManager::setOptions(const Options& options) {
    options_ = options;
}

Result<void, Error> OfflineManager::submit(const OutboundMutation& mutation) {
    if (isOnline() && queue_.empty()) {
        auto sent = peers_.broadcast(mutation.envelope);
        if (sent.is_ok() && (sent.unwrap() > 0 || peers_.isHost())) {
            if (sync_trace_enabled()) {
                qCInfo(rallyOfflineLog) << "SYNC: sent seq=" << mutation.sequence
                                        << "devices=" << sent.unwrap();
            }
            return Result<void, Error>::ok();
        }
    }
    return enqueue(mutation);
}

Result<void, Error> OfflineManager::enqueue(const OutboundMutation& mutation) {
    OfflineOperation op;
    op.id = Uuid::generate();
    op.entity_ref = mutation.entity_ref;
    op.payload = mutation.envelope;
    op.created_at = Timestamp::now();
    op.sequence = mutation.sequence;

    if (queue_.size() >= static_cast<size_t>(options_.max_queue_size)) {
        auto error = make_error(ErrorCode::QueueFull,
                                "Offline queue is full (" + std::to_string(queue_.size()) + " operations)");
        qCWarning(rallyOfflineLog) << "queue full; rejecting" << op.entity_ref;
        emit operationFailed(op, error);
        return Result<void, Error>::err(std::move(error));
    }

    queue_.push_back(op);
    if (sync_trace_enabled()) {
        qCInfo(rallyOfflineLog) << "SYNC: queued seq=" << op.sequence << op.entity_ref
                                << "size=" << queue_.size();
    }
    emit operationQueued(op);
    emit statusChanged();
    flush();
    return Result<void, Error>::ok();
}

void OfflineManager::flush() {
    if (in_flight_ || !isOnline() || queue_.empty()) {
        return;
    }
    const auto recipients = peers_.connectedDevices();
    if (recipients.empty()) {
        if (sync_trace_enabled()) {
            qCInfo(rallyOfflineLog) << "SYNC: flush paused, no connected devices";
        }
        return;
    }

    const auto& head = queue_.front();
    auto sent = peers_.broadcast(head.payload);
    if (sent.is_err()) {
        qCWarning(rallyOfflineLog) << "flush failed:" << sent.unwrap_err().message.c_str();
        return;
    }

    InFlight flight;
    flight.operation_id = head.id;
    flight.sequence = head.sequence;
    flight.awaiting = std::set<Uuid>(recipients.begin(), recipients.end());
    in_flight_ = std::move(flight);
    if (sync_trace_enabled()) {
        qCInfo(rallyOfflineLog) << "SYNC: flushing seq=" << head.sequence
                                << "awaiting=" << recipients.size();
    }
    ack_timer_.start(options_.ack_timeout_ms);
}

void OfflineManager::handleAck(const Uuid& from, quint64 sequence) {
    if (!in_flight_ || in_flight_->sequence != sequence) {
        return;
    }
    in_flight_->awaiting.erase(from);
    if (!in_flight_->awaiting.empty()) {
        return;
    }

    abortInFlight();
    auto op = queue_.front();
    queue_.pop_front();
    if (sync_trace_enabled()) {
        qCInfo(rallyOfflineLog) << "SYNC: delivered seq=" << op.sequence << "remaining=" << queue_.size();
    }
    emit operationProcessed(op);
    emit statusChanged();
    flush();
}

void OfflineManager::onAckTimeout() {
    if (!in_flight_ || queue_.empty()) {
        return;
    }
    in_flight_.reset();

    auto& head = queue_.front();
    ++head.retry_count;
    ++total_retries_;
    if (head.retry_count >= options_.max_retries) {
        auto failed = head;
        queue_.pop_front();
        qCWarning(rallyOfflineLog) << "giving up on" << failed.entity_ref << "seq=" << failed.sequence
                                   << "after" << failed.retry_count << "attempts";
        emit operationFailed(failed, make_error(ErrorCode::QueueOperationExhausted,
                                                "Not acknowledged after " +
                                                std::to_string(failed.retry_count) + " attempts"));
    } else {
        qCInfo(rallyOfflineLog) << "no ack for seq=" << head.sequence << "; retry" << head.retry_count;
    }
    emit statusChanged();
    flush();
}

void OfflineManager::abortInFlight() {
    ack_timer_.stop();
    in_flight_.reset();
}

void OfflineManager::handleDeviceConnected() {
    flush();
}

void OfflineManager::handleDeviceDisconnected(const Uuid& device_id) {
    if (!in_flight_ || in_flight_->awaiting.count(device_id) == 0) {
        return;
    }
    // Resend to whoever is still reachable instead of waiting out the timer.
    abortInFlight();
    flush();
}

void OfflineManager::handleConnectivityLost() {
    if (phase_ == ConnectivityPhase::Online) {
        goOffline();
    }
    if (phase_ == ConnectivityPhase::Offline && network_available_) {
        startReconnection();
    }
}

void OfflineManager::handleSessionEnded() {
    ++attempt_generation_;
    backoff_timer_.stop();
    abortInFlight();
    if (phase_ != ConnectivityPhase::Failed) {
        attempt_count_ = 0;
        next_delay_ms_ = 0;
        setPhase(ConnectivityPhase::Online);
    }
}

void OfflineManager::setNetworkAvailable(bool available) {
    if (network_available_ == available) {
        return;
    }
    network_available_ = available;
    qCInfo(rallyOfflineLog) << "network" << (available ? "available" : "unavailable");

    if (!available) {
        ++attempt_generation_;
        backoff_timer_.stop();
        if (phase_ == ConnectivityPhase::Online) {
            goOffline();
        } else if (phase_ == ConnectivityPhase::Reconnecting) {
            setPhase(ConnectivityPhase::Offline);
        }
    } else if (phase_ == ConnectivityPhase::Offline) {
        startReconnection();
    }
    emit statusChanged();
}

void OfflineManager::forceReconnect() {
    qCInfo(rallyOfflineLog) << "forced reconnect";
    ++attempt_generation_;
    backoff_timer_.stop();
    attempt_count_ = 0;
    if (phase_ == ConnectivityPhase::Online) {
        abortInFlight();
    }
    setPhase(ConnectivityPhase::Reconnecting);
    emit reconnectionStarted();
    scheduleNextAttempt();
}

int OfflineManager::clearQueue() {
    const int count = static_cast<int>(queue_.size());
    abortInFlight();
    queue_.clear();
    qCInfo(rallyOfflineLog) << "offline queue cleared;" << count << "operations dropped";
    emit queueCleared(count);
    emit statusChanged();
    return count;
}

void OfflineManager::shutdown() {
    handleSessionEnded();
}

void OfflineManager::goOffline() {
    abortInFlight();
    setPhase(ConnectivityPhase::Offline);
    qCWarning(rallyOfflineLog) << "went offline; queued=" << queue_.size();
    emit wentOffline();
}

void OfflineManager::startReconnection() {
    if (phase_ == ConnectivityPhase::Reconnecting || phase_ == ConnectivityPhase::Failed) {
        return;
    }
    attempt_count_ = 0;
    ++attempt_generation_;
    setPhase(ConnectivityPhase::Reconnecting);
    qCInfo(rallyOfflineLog) << "starting reconnection; max attempts" << options_.reconnection.max_attempts;
    emit reconnectionStarted();
    scheduleNextAttempt();
}

void OfflineManager::scheduleNextAttempt() {
    const auto decision = decide_reconnect(options_.reconnection, attempt_count_);
    if (decision.give_up) {
        next_delay_ms_ = 0;
        setPhase(ConnectivityPhase::Failed);
        qCWarning(rallyOfflineLog) << "reconnection failed after" << attempt_count_ << "attempts";
        emit reconnectionFailed(last_error_);
        return;
    }
    next_delay_ms_ = decision.delay_ms;
    backoff_timer_.start(decision.delay_ms);
    emit statusChanged();
}

void OfflineManager::attempt() {
    if (phase_ != ConnectivityPhase::Reconnecting) {
        return;
    }
    ++attempt_count_;
    last_attempt_at_ = Timestamp::now();
    next_delay_ms_ = 0;
    const auto generation = attempt_generation_;
    qCInfo(rallyOfflineLog) << "reconnection attempt" << attempt_count_ << "of"
                            << options_.reconnection.max_attempts;
    emit reconnectionAttempt(attempt_count_);
    emit statusChanged();

    QPointer<OfflineManager> guard(this);
    reconnector_.rejoin([guard, generation](Result<void, Error> result) {
        if (guard) {
            guard->onAttemptFinished(generation, std::move(result));
        }
    });
}

void OfflineManager::onAttemptFinished(uint64_t generation, Result<void, Error> result) {
    if (generation != attempt_generation_ || phase_ != ConnectivityPhase::Reconnecting) {
        return;
    }
    if (result.is_ok()) {
        attempt_count_ = 0;
        next_delay_ms_ = 0;
        setPhase(ConnectivityPhase::Online);
        qCInfo(rallyOfflineLog) << "back online; flushing" << queue_.size() << "operations";
        emit backOnline();
        flush();
        return;
    }

    last_error_ = result.unwrap_err();
    qCInfo(rallyOfflineLog) << "attempt" << attempt_count_ << "failed:" << last_error_.message.c_str();
    scheduleNextAttempt();
}

void OfflineManager::setPhase(ConnectivityPhase phase) {
    if (phase_ == phase) {
        return;
    }
    phase_ = phase;
    emit statusChanged();
}

OfflineStats OfflineManager::stats() const {
    OfflineStats out;
    out.queue_size = queueSize();
    out.is_online = isOnline();
    out.phase = phase_;
    if (!queue_.empty()) {
        out.oldest_operation_at = queue_.front().created_at;
    }
    out.total_retries = total_retries_;
    return out;
}

ReconnectionStatus OfflineManager::reconnectionStatus() const {
    ReconnectionStatus out;
    out.is_reconnecting = phase_ == ConnectivityPhase::Reconnecting;
    out.attempt_count = attempt_count_;
    out.max_attempts = options_.reconnection.max_attempts;
    out.last_attempt_at = last_attempt_at_;
    out.next_delay_ms = next_delay_ms_;
    out.phase = phase_;
    return out;
}

} // namespace rally::sync
