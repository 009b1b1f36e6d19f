#pragma once

#include "core/result.hpp"
#include <QByteArray>
#include <cstdint>
#include <optional>

namespace rally::network {

/**
 * Frame types carried on a peer channel.
 */
enum class FrameType : uint8_t {
    Hello = 0x01,
    Goodbye = 0x02,

    SyncEnvelope = 0x20,

    Ping = 0x30,
    Pong = 0x31,
};

/**
 * Frame header.
 *
 * Format:
 * - Magic (2 bytes): 0x52 0x59 ("RY")
 * - Version (1 byte)
 * - Type (1 byte)
 * - Length (4 bytes, big-endian)
 * - Payload (variable)
 */
struct FrameHeader {
    static constexpr uint8_t MAGIC[2] = {0x52, 0x59};  // "RY"
    static constexpr uint8_t VERSION = 1;
    static constexpr int HEADER_SIZE = 8;
    static constexpr uint32_t MAX_PAYLOAD = 16u * 1024u * 1024u;

    FrameType type = FrameType::Ping;
    uint32_t length = 0;
};

struct Frame {
    FrameType type = FrameType::Ping;
    QByteArray payload;
};

QByteArray serializeHeader(const FrameHeader& header);
Result<FrameHeader, Error> deserializeHeader(const QByteArray& data);

/**
 * Header followed by payload, ready for the socket.
 */
QByteArray encodeFrame(FrameType type, const QByteArray& payload);

/**
 * FrameReader - reassembles frames from arbitrary socket reads.
 *
 * next() returns nullopt while a frame is incomplete and an error once the
 * stream is corrupt; after an error the reader must be discarded.
 */
class FrameReader {
public:
    void append(const QByteArray& bytes) { buffer_.append(bytes); }

    [[nodiscard]] Result<std::optional<Frame>, Error> next();

    [[nodiscard]] int buffered() const { return static_cast<int>(buffer_.size()); }

private:
    QByteArray buffer_;
};

} // namespace rally::network
