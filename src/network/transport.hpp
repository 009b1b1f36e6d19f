#pragma once

#include "core/types.hpp"
#include "core/result.hpp"
#include "network/framing.hpp"
#include <QElapsedTimer>
#include <QHostAddress>
#include <QJsonObject>
#include <QObject>
#include <QTcpServer>
#include <QTcpSocket>
#include <QTimer>
#include <functional>
#include <map>
#include <memory>
#include <vector>

namespace rally::network {

/**
 * Candidate - one address at which a device accepts peer channels.
 */
struct Candidate {
    QString host;
    uint16_t port = 0;

    bool operator==(const Candidate&) const = default;
};

/**
 * HandshakeInfo - the reachability metadata exchanged through signaling
 * before a channel can be opened.
 */
struct HandshakeInfo {
    std::vector<Candidate> candidates;
    QString token;

    [[nodiscard]] QJsonObject toJson() const;
    [[nodiscard]] static Result<HandshakeInfo, Error> fromJson(const QJsonObject& obj);
};

/**
 * Channel - an ordered, reliable framed byte stream to one remote device.
 *
 * new -> connecting -> connected -> (disconnected | failed) -> closed
 *
 * Disconnected can be recovered by negotiating a fresh channel; failed is
 * terminal for this instance.
 */
class Channel : public QObject {
    Q_OBJECT

public:
    enum class State {
        New,
        Connecting,
        Connected,
        Disconnected,
        Failed,
        Closed
    };

    explicit Channel(QObject* parent = nullptr);
    ~Channel() override;

    /**
     * Open a TCP connection to a candidate (dialing side).
     */
    void dial(const Candidate& candidate);

    /**
     * Take ownership of an accepted socket (listening side).
     */
    void adopt(QTcpSocket* socket);

    /**
     * Send a frame. Only Hello/Goodbye may go out before the channel is
     * connected; everything else fails with NotConnected.
     */
    Result<void, Error> send(FrameType type, const QByteArray& payload);

    /**
     * Say goodbye (when connected) and release the socket. Idempotent.
     */
    void close(const QString& reason = QString{});

    /**
     * Drop the socket without a goodbye; the remote sees a lost link.
     */
    void abort();

    void markConnected(const Uuid& remote_device);
    void setHeartbeat(int interval_ms, int miss_limit);

    [[nodiscard]] State state() const { return state_; }
    [[nodiscard]] bool isConnected() const { return state_ == State::Connected; }
    [[nodiscard]] const Uuid& remoteDevice() const { return remote_device_; }
    [[nodiscard]] QHostAddress peerAddress() const;
    [[nodiscard]] uint16_t peerPort() const;
    [[nodiscard]] QString goodbyeReason() const { return goodbye_reason_; }

signals:
    void socketConnected();
    void connected();
    void frameReceived(FrameType type, const QByteArray& payload);
    void disconnected(bool graceful);
    void stateChanged(State state);
    void error(const QString& message);

private slots:
    void onSocketConnected();
    void onSocketDisconnected();
    void onSocketError(QAbstractSocket::SocketError error);
    void onReadyRead();
    void onHeartbeat();

private:
    State state_ = State::New;
    std::unique_ptr<QTcpSocket> socket_;
    FrameReader reader_;
    Uuid remote_device_;
    QString goodbye_reason_;
    QTimer heartbeat_;
    QElapsedTimer since_inbound_;
    int heartbeat_interval_ms_ = 0;
    int heartbeat_miss_limit_ = 3;

    void bindSocket();
    void setState(State state);
    void loseLink(bool graceful);
    void failWith(const QString& message);
    void releaseSocket();
};

/**
 * TransportListener - accepts inbound peer channels.
 */
class TransportListener : public QObject {
    Q_OBJECT

public:
    explicit TransportListener(QObject* parent = nullptr);
    ~TransportListener() override;

    /**
     * Start listening (0 picks an ephemeral port). Returns the bound port.
     */
    Result<uint16_t, Error> listen(uint16_t port = 0);
    void close();

    [[nodiscard]] uint16_t port() const;
    [[nodiscard]] bool isListening() const;

signals:
    void newConnection(QTcpSocket* socket);

private slots:
    void onNewConnection();

private:
    std::unique_ptr<QTcpServer> server_;
};

/**
 * TransportManager - negotiates channels from signaling-exchanged metadata.
 *
 * Both sides call prepareHandshake() and exchange the results; each side
 * then calls open() with the other's info. The device with the smaller id
 * dials, the other accepts, and both complete once Hello frames carrying
 * the listener's token have been exchanged.
 */
class TransportManager : public QObject {
    Q_OBJECT

public:
    using ChannelPtr = std::unique_ptr<Channel>;
    using OpenResult = Result<ChannelPtr, Error>;
    using OpenCallback = std::function<void(OpenResult)>;

    struct Options {
        int negotiation_timeout_ms = 30000;
        int heartbeat_interval_ms = 5000;
        int heartbeat_miss_limit = 3;
        int redial_delay_ms = 250;
    };

    explicit TransportManager(const Uuid& local_device, QObject* parent = nullptr);
    ~TransportManager() override;

    void setOptions(const Options& options) { options_ = options; }
    [[nodiscard]] const Options& options() const { return options_; }

    Result<uint16_t, Error> listen(uint16_t port = 0);
    void stopListening();
    [[nodiscard]] uint16_t listeningPort() const;

    /**
     * Local metadata for a negotiation with `remote`. Registers a fresh
     * token, replacing any negotiation already pending for that device.
     */
    HandshakeInfo prepareHandshake(const Uuid& remote);

    /**
     * Open a channel to `remote`. `done` fires exactly once unless the
     * negotiation is cancelled first, in which case it never fires.
     * Fails with NegotiationTimeout or NegotiationFailed.
     */
    void open(const Uuid& remote, const HandshakeInfo& remote_info, OpenCallback done);

    void cancel(const Uuid& remote);
    void cancelAll();

    /**
     * Send an envelope; NotConnected when the channel is not connected.
     */
    Result<void, Error> send(Channel* channel, const QByteArray& payload);

    /**
     * Close and schedule deletion. Idempotent; safe inside the channel's
     * own signal handlers.
     */
    void close(ChannelPtr channel, const QString& reason = QString{});

    [[nodiscard]] bool isNegotiating(const Uuid& remote) const;
    [[nodiscard]] std::vector<Candidate> localCandidates() const;
    [[nodiscard]] const Uuid& localDevice() const { return local_device_; }

    [[nodiscard]] static bool dialsFirst(const Uuid& local, const Uuid& remote) {
        return local < remote;
    }

signals:
    void negotiationFinished(const Uuid& remote, bool ok);

private slots:
    void onNewConnection(QTcpSocket* socket);

private:
    struct Negotiation {
        Uuid remote;
        QString local_token;
        QString remote_token;
        bool dialer = false;
        bool opened = false;
        bool rejected = false;
        std::vector<Candidate> candidates;
        size_t next_candidate = 0;
        OpenCallback done;
        std::unique_ptr<QTimer> deadline;
        ChannelPtr channel;
        uint64_t generation = 0;
    };

    Uuid local_device_;
    Options options_;
    std::unique_ptr<TransportListener> listener_;
    std::map<Uuid, std::unique_ptr<Negotiation>> negotiations_;
    std::vector<ChannelPtr> unclaimed_;
    uint64_t next_generation_ = 1;

    Negotiation* find(const Uuid& remote, uint64_t generation);
    void dialNext(Negotiation& neg);
    void onDialerHello(Negotiation& neg, const QByteArray& payload);
    void onInboundHello(Channel* channel, const QByteArray& payload);
    void finish(const Uuid& remote, OpenResult result);
    void discard(ChannelPtr channel, const QString& reason);
    ChannelPtr takeUnclaimed(Channel* channel);
    void armChannel(Channel& channel) const;
};

} // namespace rally::network
