#pragma once

#include "core/config.hpp"
#include "network/connection_orchestrator.hpp"
#include "sync/offline_manager.hpp"
#include "sync/sync_engine.hpp"
#include <QJsonObject>
#include <QObject>
#include <memory>

namespace rally::controllers {

/**
 * SyncController - the one entry point an application talks to.
 *
 * Constructed by the application and handed to whoever needs it; there is
 * no global instance. Every component event is re-published twice: as a
 * typed signal, and through event(name, detail) so a listener can observe
 * the whole stream in order.
 *
 * Event names: device-joined, device-left, connection-error, room-created,
 * room-joined, room-ended, went-offline, back-online, reconnection-started,
 * reconnection-failed, operation-queued, operation-processed,
 * operation-failed, queue-cleared, remote-mutation, snapshot-applied.
 */
class SyncController : public QObject {
    Q_OBJECT

    Q_PROPERTY(bool initialized READ isInitialized NOTIFY initializedChanged)
    Q_PROPERTY(QString deviceId READ deviceId NOTIFY initializedChanged)
    Q_PROPERTY(QString roomId READ roomId NOTIFY statusChanged)
    Q_PROPERTY(bool host READ isHost NOTIFY statusChanged)
    Q_PROPERTY(int connectedDeviceCount READ connectedDeviceCount NOTIFY statusChanged)
    Q_PROPERTY(bool online READ isOnline NOTIFY statusChanged)
    Q_PROPERTY(int offlineQueueSize READ offlineQueueSize NOTIFY statusChanged)
    Q_PROPERTY(bool reconnecting READ isReconnecting NOTIFY statusChanged)
    Q_PROPERTY(int reconnectAttemptCount READ reconnectAttemptCount NOTIFY statusChanged)

public:
    using RoomCallback = network::ConnectionOrchestrator::RoomCallback;
    using DoneCallback = network::ConnectionOrchestrator::DoneCallback;
    using RoomsCallback = network::ConnectionOrchestrator::RoomsCallback;

    explicit SyncController(QObject* parent = nullptr);
    ~SyncController() override;

    /**
     * Validate the configuration and start accepting peer channels on
     * `listen_port` (0 picks a free port). A second call while initialized
     * is a no-op. The device identity is fixed by the first call.
     */
    Result<void, Error> initialize(const SyncConfig& config, uint16_t listen_port = 0);

    /**
     * Leave the room and stop networking. Queued operations and the
     * replica stay with this instance.
     */
    Q_INVOKABLE void shutdown();

    void createRoom(RoomCallback done = {});
    void joinRoom(const QString& room_id, DoneCallback done = {});
    void listAvailableRooms(RoomsCallback done);
    Q_INVOKABLE void leaveRoom();

    Q_INVOKABLE void forceReconnect();
    Q_INVOKABLE int clearQueue();
    Q_INVOKABLE void manualSync();

    /**
     * Forward the platform's view of the network interface.
     */
    Q_INVOKABLE void reportNetworkStatus(bool online);

    Result<void, Error> submitMutation(const QString& collection,
                                       const QString& entity_id,
                                       sync::MutationOp op,
                                       const QJsonObject& fields = {});

    [[nodiscard]] std::optional<QJsonObject> entity(const QString& collection, const QString& id) const;
    [[nodiscard]] QJsonObject state() const;

    [[nodiscard]] network::ConnectionStats connectionStats() const;
    [[nodiscard]] sync::OfflineStats offlineStats() const;
    [[nodiscard]] sync::ReconnectionStatus reconnectionStatus() const;

    /**
     * All three status groups as one JSON object.
     */
    [[nodiscard]] Q_INVOKABLE QJsonObject status() const;

    [[nodiscard]] bool isInitialized() const { return initialized_; }
    [[nodiscard]] QString deviceId() const;
    [[nodiscard]] QString roomId() const;
    [[nodiscard]] bool isHost() const;
    [[nodiscard]] int connectedDeviceCount() const;
    [[nodiscard]] bool isOnline() const;
    [[nodiscard]] int offlineQueueSize() const;
    [[nodiscard]] bool isReconnecting() const;
    [[nodiscard]] int reconnectAttemptCount() const;
    [[nodiscard]] uint16_t listeningPort() const { return listening_port_; }

    [[nodiscard]] network::ConnectionOrchestrator* orchestrator() const { return orchestrator_.get(); }
    [[nodiscard]] sync::SyncEngine* engine() const { return engine_.get(); }
    [[nodiscard]] sync::OfflineManager* offline() const { return offline_.get(); }

signals:
    void event(const QString& name, const QJsonObject& detail);

    void deviceJoined(const QString& deviceId, const QString& deviceName);
    void deviceLeft(const QString& deviceId);
    void connectionError(const QString& message);
    void roomCreated(const QString& roomId);
    void roomJoined(const QString& roomId);
    void roomEnded(const QString& roomId);
    void wentOffline();
    void backOnline();
    void reconnectionStarted();
    void reconnectionFailed(const QString& message);
    void operationQueued(const QString& operationId, const QString& entityRef);
    void operationProcessed(const QString& operationId, const QString& entityRef);
    void operationFailed(const QString& operationId, const QString& message);
    void queueCleared(int count);
    void remoteMutation(const QString& collection, const QString& entityId);
    void snapshotApplied(const QString& deviceId);

    void initializedChanged();
    void statusChanged();

private:
    // Declared first so it outlives the components holding references to it.
    std::unique_ptr<network::ConnectionOrchestrator> orchestrator_;
    std::unique_ptr<sync::SyncEngine> engine_;
    std::unique_ptr<sync::OfflineManager> offline_;
    SyncConfig config_;
    bool initialized_ = false;
    uint16_t listening_port_ = 0;

    void build(const SyncConfig& config);
    void wire();
    void applyConfig(const SyncConfig& config);
    void endSession();
    void publish(const QString& name, const QJsonObject& detail = {});
    Result<void, Error> requireInitialized() const;
};

} // namespace rally::controllers
