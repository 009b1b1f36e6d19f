#pragma once

#include "core/config.hpp"
#include "core/device.hpp"
#include "core/result.hpp"
#include "network/signaling_client.hpp"
#include "network/transport.hpp"
#include "sync/peer_channel.hpp"
#include <QObject>
#include <QTimer>
#include <map>
#include <memory>
#include <optional>

namespace rally::network {

/**
 * ConnectionStatus - lifecycle of the link to one remote device.
 */
enum class ConnectionStatus {
    New,
    Connecting,
    Connected,
    Disconnected,
    Failed,
    Closed
};

[[nodiscard]] QString connectionStatusName(ConnectionStatus status);

/**
 * PeerConnection - a room member and the channel that reaches it.
 */
struct PeerConnection {
    DeviceInfo device;
    std::unique_ptr<Channel> channel;
    ConnectionStatus status = ConnectionStatus::New;
    Timestamp last_seen;
    bool offer_pending = false;
    bool announced = false;
    std::unique_ptr<QTimer> offer_timer;
};

/**
 * ConnectionStats - derived on demand, never stored.
 */
struct ConnectionStats {
    int connected_device_count = 0;
    QString room_id;
    bool is_host = false;
    Uuid host_device_id;
    QString connection_status;
    QString signaling_status;
};

/**
 * ConnectionOrchestrator - who is in the room and how to reach them.
 *
 * The device that creates a room hosts it for the room's lifetime. If the
 * host goes away the room ends for every member; nobody is promoted.
 *
 * Every pair of members holds a direct channel (full mesh), so a room of n
 * devices costs n(n-1)/2 channels. Application data is never relayed
 * through a third device.
 */
class ConnectionOrchestrator : public QObject,
                               public sync::PeerChannel,
                               public sync::Reconnector {
    Q_OBJECT

public:
    using DoneCallback = std::function<void(Result<void, Error>)>;
    using RoomCallback = std::function<void(Result<QString, Error>)>;
    using RoomsCallback = SignalingClient::RoomsCallback;

    explicit ConnectionOrchestrator(const DeviceInfo& self, QObject* parent = nullptr);
    ~ConnectionOrchestrator() override;

    void configure(const SyncConfig& config);

    /**
     * Start accepting peer channels.
     */
    Result<uint16_t, Error> start(uint16_t port = 0);

    /**
     * Leave any room, drop signaling and stop listening.
     */
    void stop();

    void createRoom(RoomCallback done);
    void joinRoom(const QString& room_id, DoneCallback done);
    void leaveRoom();
    void rejoin(DoneCallback done) override;
    void listAvailableRooms(RoomsCallback done);

    Result<size_t, Error> broadcast(const QByteArray& payload) override;
    Result<void, Error> sendTo(const Uuid& device, const QByteArray& payload) override;

    [[nodiscard]] ConnectionStats stats() const;
    [[nodiscard]] std::vector<DeviceInfo> knownDevices() const;
    [[nodiscard]] std::optional<ConnectionStatus> connectionStatus(const Uuid& device) const;

    [[nodiscard]] Uuid localDevice() const override { return self_.id; }
    [[nodiscard]] std::vector<Uuid> connectedDevices() const override;
    [[nodiscard]] std::optional<Uuid> hostDevice() const override;
    [[nodiscard]] std::optional<DeviceInfo> device(const Uuid& id) const override;
    [[nodiscard]] bool inRoom() const override { return room_.has_value(); }

    [[nodiscard]] const DeviceInfo& self() const { return self_; }
    [[nodiscard]] QString roomId() const { return room_ ? room_->id : QString{}; }
    [[nodiscard]] SignalingClient& signaling() { return *signaling_; }
    [[nodiscard]] TransportManager& transport() { return *transport_; }

signals:
    void deviceJoined(const rally::DeviceInfo& device);
    void deviceLeft(const rally::Uuid& device_id);
    void deviceConnected(const rally::DeviceInfo& device);
    void deviceDisconnected(const rally::Uuid& device_id);
    void connectionError(const rally::Error& error);
    void roomCreated(const QString& room_id);
    void roomJoined(const QString& room_id);
    void roomEnded(const QString& room_id);
    void connectivityLost();
    void messageReceived(const rally::Uuid& from, const QByteArray& payload);
    void statsChanged();

private slots:
    void onHandshake(const rally::Uuid& from, const QJsonObject& payload);
    void onHandshakeUndeliverable(const rally::Uuid& target);
    void onSignalingDeviceJoined(const rally::DeviceInfo& device);
    void onSignalingDeviceLeft(const rally::Uuid& device_id);
    void onSignalingRoomClosed(const QString& room_id);
    void onSignalingLost();

private:
    struct Room {
        QString id;
        Uuid host_id;
    };

    struct PendingRejoin {
        DoneCallback done;
        std::unique_ptr<QTimer> timer;
    };

    DeviceInfo self_;
    SyncConfig config_;
    std::unique_ptr<SignalingClient> signaling_;
    std::unique_ptr<TransportManager> transport_;
    std::map<Uuid, std::unique_ptr<PeerConnection>> peers_;
    std::optional<Room> room_;
    bool room_request_in_flight_ = false;
    // Bumped when a pending create, join or rejoin is abandoned.
    uint64_t room_generation_ = 0;
    std::optional<PendingRejoin> pending_rejoin_;

    void ensureSignaling(DoneCallback done);
    void adoptRoster(const signaling::RoomRoster& roster);
    PeerConnection& peerFor(const DeviceInfo& device);
    PeerConnection* findPeer(const Uuid& device);

    void sendOffer(PeerConnection& peer);
    void answerOffer(PeerConnection& peer, const QJsonObject& payload);
    void sendReject(const Uuid& target, const QString& reason);
    void beginOpen(PeerConnection& peer, const HandshakeInfo& remote_info);
    void onChannelOpened(const Uuid& remote, TransportManager::OpenResult result);
    void onChannelLost(const Uuid& remote, Channel* channel, bool graceful);
    void stopOfferTimer(PeerConnection& peer);
    void dropPeer(const Uuid& device_id, const QString& reason);

    void endRoom(const QString& room_id);
    void teardownRoom(const QString& reason);
    void finishRejoin(Result<void, Error> result);
    void later(std::function<void()> fn);
    [[nodiscard]] bool stale(uint64_t generation) const { return generation != room_generation_; }
    static Error cancelledRequest();
    [[nodiscard]] size_t connectedCount() const;
};

} // namespace rally::network
