#pragma once

#include "core/device.hpp"
#include "core/result.hpp"
#include "network/signaling_protocol.hpp"
#include <QHostAddress>
#include <QObject>
#include <QTcpServer>
#include <QTcpSocket>
#include <QTimer>
#include <map>
#include <memory>
#include <vector>

namespace rally::network {

/**
 * SignalingRelay - the rendezvous service devices use to find each other.
 *
 * Keeps room membership and forwards handshake metadata between members.
 * When a host's session drops without leaving, the room is held for a
 * grace period so the host can come back and resume it; after that the
 * room is closed for everyone.
 */
class SignalingRelay : public QObject {
    Q_OBJECT

public:
    struct Options {
        int host_grace_ms = 30000;
        int room_timeout_ms = 300000;
        int reap_interval_ms = 5000;
    };

    explicit SignalingRelay(QObject* parent = nullptr);
    ~SignalingRelay() override;

    void setOptions(const Options& options);

    Result<uint16_t, Error> listen(const QHostAddress& address = QHostAddress::Any, uint16_t port = 0);
    void close();

    [[nodiscard]] uint16_t port() const;
    [[nodiscard]] int sessionCount() const { return static_cast<int>(sessions_.size()); }
    [[nodiscard]] std::vector<signaling::RoomSummary> rooms() const;
    [[nodiscard]] std::vector<Uuid> members(const QString& room_id) const;

    /**
     * Room id in the form room-<epochMillis>-<random>.
     */
    [[nodiscard]] static QString generateRoomId();

signals:
    void roomOpened(const QString& room_id);
    void roomClosed(const QString& room_id);

private slots:
    void onNewConnection();
    void reapIdleRooms();

private:
    struct Session {
        QTcpSocket* socket = nullptr;
        signaling::LineReader reader;
        std::optional<DeviceInfo> device;
        QString room_id;
    };

    struct Room {
        QString id;
        Uuid host_id;
        std::map<Uuid, DeviceInfo> members;
        Timestamp created_at;
        qint64 idle_since_ms = 0;
        bool host_away = false;
        std::unique_ptr<QTimer> grace;
    };

    Options options_;
    std::unique_ptr<QTcpServer> server_;
    std::map<QTcpSocket*, std::unique_ptr<Session>> sessions_;
    std::map<Uuid, QTcpSocket*> by_device_;
    std::map<QString, std::unique_ptr<Room>> rooms_;
    QTimer reaper_;

    void onReadyRead(QTcpSocket* socket);
    void onSessionClosed(QTcpSocket* socket);
    void handle(Session& session, const QJsonObject& message);

    void handleRegister(Session& session, const QJsonObject& message, int request_id);
    void handleCreateRoom(Session& session, const QJsonObject& message, int request_id);
    void handleJoinRoom(Session& session, const QJsonObject& message, int request_id);
    void handleListRooms(Session& session, int request_id);
    void handleHandshake(Session& session, const QJsonObject& message);
    void handleLeaveRoom(Session& session);

    void leaveCurrentRoom(Session& session);
    void closeRoom(const QString& room_id);
    void startHostGrace(Room& room);

    void reply(Session& session, QJsonObject message, int request_id);
    void replyError(Session& session, const QString& code, const QString& text, int request_id);
    void sendToDevice(const Uuid& device, const QJsonObject& message);
    void broadcastToRoom(const Room& room, const QJsonObject& message, const Uuid& except);
    Session* sessionFor(const Uuid& device);
};

} // namespace rally::network
