#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "sync/peer_channel.hpp"
#include "sync/sync_engine.hpp"
#include <QMetaType>
#include <QObject>
#include <QTimer>
#include <deque>
#include <optional>
#include <set>

namespace rally::sync {

enum class ConnectivityPhase {
    Online,
    Offline,
    Reconnecting,
    Failed
};

[[nodiscard]] QString connectivityPhaseName(ConnectivityPhase phase);

/**
 * OfflineOperation - a local mutation waiting for delivery.
 */
struct OfflineOperation {
    Uuid id;
    QString entity_ref;
    QByteArray payload;
    Timestamp created_at;
    int retry_count = 0;
    uint64_t sequence = 0;
};

struct OfflineStats {
    int queue_size = 0;
    bool is_online = true;
    ConnectivityPhase phase = ConnectivityPhase::Online;
    Timestamp oldest_operation_at;
    int total_retries = 0;
};

struct ReconnectionStatus {
    bool is_reconnecting = false;
    int attempt_count = 0;
    int max_attempts = 0;
    Timestamp last_attempt_at;
    int next_delay_ms = 0;
    ConnectivityPhase phase = ConnectivityPhase::Online;
};

/**
 * OfflineManager - owns the offline queue and the reconnection loop.
 *
 * online -> offline -> reconnecting -> online
 *                                   -> failed (attempt ceiling reached)
 *
 * Failed is left only through forceReconnect(). Queued operations are
 * delivered one at a time in creation order; the head is removed once every
 * device it was sent to has acknowledged it, or dropped with
 * operationFailed after the retry ceiling.
 */
class OfflineManager : public QObject {
    Q_OBJECT

public:
    struct Options {
        ReconnectionConfig reconnection;
        int ack_timeout_ms = 5000;
        int max_retries = 3;
        int max_queue_size = 1000;
    };

    OfflineManager(PeerChannel& peers, Reconnector& reconnector, QObject* parent = nullptr);
    ~OfflineManager() override;

    void setOptions(const Options& options);
    [[nodiscard]] const Options& options() const { return options_; }

    /**
     * Deliver now when online with an empty queue, otherwise enqueue.
     * Fails with QueueFull when the queue is at capacity.
     */
    Result<void, Error> submit(const OutboundMutation& mutation);

    /**
     * Cancel any backoff wait and attempt right away with a fresh counter.
     */
    void forceReconnect();

    /**
     * Drop every queued operation. Returns how many were dropped.
     */
    int clearQueue();

    /**
     * Stop timers and ignore outstanding attempts. A reconnection in
     * progress is abandoned and the phase returns to online, except from
     * failed. The queue is kept.
     */
    void shutdown();

    [[nodiscard]] ConnectivityPhase phase() const { return phase_; }
    [[nodiscard]] bool isOnline() const { return phase_ == ConnectivityPhase::Online && network_available_; }
    [[nodiscard]] bool networkAvailable() const { return network_available_; }
    [[nodiscard]] int queueSize() const { return static_cast<int>(queue_.size()); }
    [[nodiscard]] const std::deque<OfflineOperation>& queue() const { return queue_; }
    [[nodiscard]] OfflineStats stats() const;
    [[nodiscard]] ReconnectionStatus reconnectionStatus() const;

public slots:
    void handleAck(const rally::Uuid& from, quint64 sequence);
    void handleConnectivityLost();
    void handleDeviceConnected();
    void handleDeviceDisconnected(const rally::Uuid& device_id);
    void handleSessionEnded();

    /**
     * Host environment's view of the network (interface up or down).
     */
    void setNetworkAvailable(bool available);

signals:
    void wentOffline();
    void backOnline();
    void reconnectionStarted();
    void reconnectionAttempt(int attempt);
    void reconnectionFailed(const rally::Error& error);
    void operationQueued(const rally::sync::OfflineOperation& operation);
    void operationProcessed(const rally::sync::OfflineOperation& operation);
    void operationFailed(const rally::sync::OfflineOperation& operation, const rally::Error& error);
    void queueCleared(int count);
    void statusChanged();

private:
    struct InFlight {
        Uuid operation_id;
        uint64_t sequence = 0;
        std::set<Uuid> awaiting;
    };

    PeerChannel& peers_;
    Reconnector& reconnector_;
    Options options_;
    std::deque<OfflineOperation> queue_;
    std::optional<InFlight> in_flight_;
    QTimer ack_timer_;
    QTimer backoff_timer_;
    ConnectivityPhase phase_ = ConnectivityPhase::Online;
    bool network_available_ = true;
    uint64_t attempt_generation_ = 0;
    int attempt_count_ = 0;
    int next_delay_ms_ = 0;
    int total_retries_ = 0;
    Timestamp last_attempt_at_;
    Error last_error_;

    Result<void, Error> enqueue(const OutboundMutation& mutation);
    void flush();
    void onAckTimeout();
    void abortInFlight();

    void goOffline();
    void startReconnection();
    void scheduleNextAttempt();
    void attempt();
    void onAttemptFinished(uint64_t generation, Result<void, Error> result);
    void setPhase(ConnectivityPhase phase);
};

} // namespace rally::sync

Q_DECLARE_METATYPE(rally::sync::OfflineOperation)
