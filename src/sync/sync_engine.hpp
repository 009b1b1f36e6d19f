#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "sync/peer_channel.hpp"
#include "sync/replica.hpp"
#include "sync/sync_message.hpp"
#include <QMetaType>
#include <QObject>
#include <QTimer>
#include <map>
#include <memory>
#include <vector>

namespace rally::sync {

/**
 * OutboundMutation - a local mutation wrapped for delivery.
 *
 * The envelope is built once, so every resend carries the same sequence.
 */
struct OutboundMutation {
    uint64_t sequence = 0;
    QString entity_ref;
    QByteArray envelope;
};

/**
 * SyncEngine - the replication protocol between room members.
 *
 * Local mutations get the next sequence number for this device and are
 * applied to the local replica right away. Remote mutations from a sender
 * are applied strictly in sequence order; a gap triggers a snapshot request
 * to that sender while later messages wait in a per-sender buffer.
 * Redelivery of an applied sequence is acknowledged and otherwise ignored.
 *
 * A snapshot from the room host replaces the local replica; mutations the
 * host had not yet seen are then re-applied on top from a bounded log.
 * Snapshots from any other device are merged.
 */
class SyncEngine : public QObject {
    Q_OBJECT

public:
    struct Options {
        bool auto_sync = true;
        ConflictStrategy strategy = ConflictStrategy::Timestamp;
        DeviceRole role = DeviceRole::Spectator;
        int resync_timeout_ms = 5000;
        int resync_max_attempts = 3;
        // Per-sender bound on the log replayed after a host snapshot.
        size_t max_history = 5000;
    };

    explicit SyncEngine(PeerChannel& peers, QObject* parent = nullptr);
    ~SyncEngine() override;

    void setOptions(const Options& options);
    [[nodiscard]] const Options& options() const { return options_; }

    /**
     * Apply a local mutation and wrap it for delivery. With automatic sync
     * the result is also emitted through outboundReady; otherwise it is
     * held until manualSync().
     */
    Result<OutboundMutation, Error> submit(const Mutation& mutation);

    /**
     * Ask the host (or, on the host, every member) for a snapshot and
     * release held mutations.
     */
    void manualSync();

    /**
     * Forget per-sender bookkeeping when a session ends. The replica stays.
     */
    void resetSession();

    [[nodiscard]] const Replica& replica() const { return replica_; }
    [[nodiscard]] uint64_t localSequence() const { return local_sequence_; }
    [[nodiscard]] uint64_t lastApplied(const Uuid& sender) const;
    [[nodiscard]] size_t bufferedCount(const Uuid& sender) const;
    [[nodiscard]] size_t pendingCount() const { return held_.size(); }
    [[nodiscard]] bool isResyncing(const Uuid& sender) const { return resync_.count(sender) > 0; }

    /**
     * Mutations kept for replay over a host snapshot, across all senders.
     * Entries the host has confirmed, by snapshot clock or by ack, are
     * dropped. The host keeps none.
     */
    [[nodiscard]] size_t historySize() const;

public slots:
    void handleEnvelope(const rally::Uuid& from, const QByteArray& bytes);
    void handleDeviceConnected(const rally::DeviceInfo& device);
    void handleDeviceLeft(const rally::Uuid& device_id);

signals:
    void outboundReady(const rally::sync::OutboundMutation& mutation);
    void mutationApplied(const QString& collection, const QString& entity_id, const rally::Uuid& sender);
    void snapshotApplied(const rally::Uuid& sender);
    void ackReceived(const rally::Uuid& sender, quint64 sequence);
    void syncError(const rally::Error& error);

private:
    struct LoggedMutation {
        Mutation mutation;
        Stamp stamp;
    };

    struct Resync {
        int attempts = 0;
        std::unique_ptr<QTimer> timer;
    };

    PeerChannel& peers_;
    Options options_;
    Replica replica_;
    uint64_t local_sequence_ = 0;
    int64_t latest_timestamp_ = 0;
    std::map<Uuid, uint64_t> last_applied_;
    std::map<Uuid, std::map<uint64_t, SyncMessage>> buffers_;
    std::map<Uuid, std::map<uint64_t, LoggedMutation>> history_;
    std::map<Uuid, Resync> resync_;
    std::vector<OutboundMutation> held_;

    void onMutation(const SyncMessage& msg);
    void onSnapshotRequest(const SyncMessage& msg);
    void onSnapshotResponse(const SyncMessage& msg);

    bool applyRemote(const SyncMessage& msg);
    void drainBuffer(const Uuid& sender);
    void requestSnapshot(const Uuid& target);
    void startResync(const Uuid& sender);
    void onResyncTimeout(const Uuid& sender);
    void stopResync(const Uuid& sender);
    void record(const Uuid& sender, uint64_t sequence, LoggedMutation entry);
    void pruneHistory(const Uuid& sender, uint64_t through);
    void sendAck(const Uuid& to, uint64_t sequence);
    void send(const Uuid& to, const SyncMessage& msg);

    [[nodiscard]] int localPriority() const;
    [[nodiscard]] int64_t nextTimestamp();
    [[nodiscard]] SyncMessage envelope(MessageKind kind, uint64_t sequence) const;
};

} // namespace rally::sync

Q_DECLARE_METATYPE(rally::sync::OutboundMutation)
