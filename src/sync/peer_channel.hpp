#pragma once

#include "core/device.hpp"
#include "core/result.hpp"
#include <QByteArray>
#include <functional>
#include <optional>
#include <vector>

namespace rally::sync {

/**
 * PeerChannel - what the sync layer needs from the room's mesh.
 *
 * Implemented by the connection orchestrator; tests substitute an
 * in-memory fake.
 */
class PeerChannel {
public:
    virtual ~PeerChannel() = default;

    [[nodiscard]] virtual Uuid localDevice() const = 0;
    [[nodiscard]] virtual std::vector<Uuid> connectedDevices() const = 0;
    [[nodiscard]] virtual std::optional<Uuid> hostDevice() const = 0;
    [[nodiscard]] virtual std::optional<DeviceInfo> device(const Uuid& id) const = 0;
    [[nodiscard]] virtual bool inRoom() const = 0;

    [[nodiscard]] bool isHost() const {
        const auto host = hostDevice();
        return host && *host == localDevice();
    }

    /**
     * Send to every connected device. Returns how many devices the payload
     * was handed to; NotInRoom when there is no session.
     */
    virtual Result<size_t, Error> broadcast(const QByteArray& payload) = 0;

    /**
     * NotConnected when there is no live channel to `device`.
     */
    virtual Result<void, Error> sendTo(const Uuid& device, const QByteArray& payload) = 0;
};

/**
 * Reconnector - re-establishes the room session after connectivity loss.
 */
class Reconnector {
public:
    using DoneCallback = std::function<void(Result<void, Error>)>;

    virtual ~Reconnector() = default;

    /**
     * Re-register with signaling, rejoin the last room and renegotiate the
     * mesh. `done` is invoked from the event loop.
     */
    virtual void rejoin(DoneCallback done) = 0;
};

} // namespace rally::sync
