#pragma once

#include "core/device.hpp"
#include "core/result.hpp"
#include "network/signaling_protocol.hpp"
#include <QObject>
#include <QTcpSocket>
#include <QTimer>
#include <functional>
#include <map>
#include <memory>
#include <vector>

namespace rally::network {

/**
 * SignalingClient - talks to the rendezvous relay.
 *
 * Carries only connection-bootstrap metadata and membership events, never
 * application payload. Every request is bounded by the configured timeout;
 * an unreachable or silent relay yields SignalingUnavailable.
 *
 * Completion callbacks are always invoked from the event loop, never from
 * inside the call that issued the request.
 */
class SignalingClient : public QObject {
    Q_OBJECT

public:
    enum class Status {
        Disconnected,
        Connecting,
        Connected
    };

    using DoneCallback = std::function<void(Result<void, Error>)>;
    using RoomCallback = std::function<void(Result<QString, Error>)>;
    using RosterCallback = std::function<void(Result<signaling::RoomRoster, Error>)>;
    using RoomsCallback = std::function<void(Result<std::vector<signaling::RoomSummary>, Error>)>;

    explicit SignalingClient(QObject* parent = nullptr);
    ~SignalingClient() override;

    void setTimeout(int timeout_ms) { timeout_ms_ = timeout_ms; }

    /**
     * Connect and register `self` with the relay.
     */
    void connectToRelay(const QString& host, uint16_t port, const DeviceInfo& self, DoneCallback done);

    /**
     * Drop the relay session. Pending requests fail with SignalingUnavailable;
     * connectionLost is not emitted.
     */
    void disconnectFromRelay();

    /**
     * Ask the relay to open a room. An empty id lets the relay choose one.
     */
    void announceRoom(const QString& room_id, RoomCallback done);

    /**
     * Join a room and receive its roster. Fails with RoomNotFound.
     */
    void joinRoom(const QString& room_id, RosterCallback done);

    void listRooms(RoomsCallback done);

    /**
     * Relay handshake metadata to another member (fire-and-forget).
     */
    void exchangeHandshake(const Uuid& target, const QJsonObject& payload);

    void leaveRoom();

    [[nodiscard]] Status status() const { return status_; }
    [[nodiscard]] bool isConnected() const { return status_ == Status::Connected; }
    [[nodiscard]] const DeviceInfo& self() const { return self_; }

signals:
    void deviceJoined(const rally::DeviceInfo& device);
    void deviceLeft(const rally::Uuid& device_id);
    void roomClosed(const QString& room_id);
    void handshakeReceived(const rally::Uuid& from, const QJsonObject& payload);
    void handshakeUndeliverable(const rally::Uuid& target);
    void connectionLost();
    void statusChanged(rally::network::SignalingClient::Status status);

private slots:
    void onSocketConnected();
    void onSocketDisconnected();
    void onSocketError(QAbstractSocket::SocketError error);
    void onReadyRead();

private:
    using ReplyHandler = std::function<void(Result<QJsonObject, Error>)>;

    struct Pending {
        ReplyHandler handler;
        std::unique_ptr<QTimer> timer;
    };

    std::unique_ptr<QTcpSocket> socket_;
    signaling::LineReader reader_;
    std::map<int, Pending> pending_;
    std::vector<DoneCallback> connect_waiters_;
    std::unique_ptr<QTimer> connect_timer_;
    DeviceInfo self_;
    Status status_ = Status::Disconnected;
    int timeout_ms_ = 10000;
    int next_request_ = 1;

    void request(QJsonObject message, ReplyHandler handler);
    std::optional<ReplyHandler> takePending(int request_id);
    void dispatch(const QJsonObject& message);
    void finishConnect(const Result<void, Error>& result);
    void tearDown(const Error& reason, bool notify_lost);
    void setStatus(Status status);
    void failLater(ReplyHandler handler, Error error);
};

} // namespace rally::network
