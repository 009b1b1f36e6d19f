#include "network/framing.hpp"

namespace rally::network {

namespace {

bool known_type(uint8_t raw) {
    switch (static_cast<FrameType>(raw)) {
        case FrameType::Hello:
        case FrameType::Goodbye:
        case FrameType::SyncEnvelope:
        case FrameType::Ping:
        case FrameType::Pong:
            return true;
    }
    return false;
}

} // namespace

QByteArray serializeHeader(const FrameHeader& header) {
    QByteArray data(FrameHeader::HEADER_SIZE, '\0');

    data[0] = static_cast<char>(FrameHeader::MAGIC[0]);
    data[1] = static_cast<char>(FrameHeader::MAGIC[1]);
    data[2] = static_cast<char>(FrameHeader::VERSION);
    data[3] = static_cast<char>(header.type);
    data[4] = static_cast<char>((header.length >> 24) & 0xFF);
    data[5] = static_cast<char>((header.length >> 16) & 0xFF);
    data[6] = static_cast<char>((header.length >> 8) & 0xFF);
    data[7] = static_cast<char>(header.length & 0xFF);

    return data;
}

Result<FrameHeader, Error> deserializeHeader(const QByteArray& data) {
    using R = Result<FrameHeader, Error>;
    if (data.size() < FrameHeader::HEADER_SIZE) {
        return R::err(make_error(ErrorCode::ProtocolError, "Header too short"));
    }

    const auto* bytes = reinterpret_cast<const uint8_t*>(data.constData());
    if (bytes[0] != FrameHeader::MAGIC[0] || bytes[1] != FrameHeader::MAGIC[1]) {
        return R::err(make_error(ErrorCode::ProtocolError, "Invalid magic"));
    }
    if (bytes[2] != FrameHeader::VERSION) {
        return R::err(make_error(ErrorCode::ProtocolError, "Unsupported version"));
    }
    if (!known_type(bytes[3])) {
        return R::err(make_error(ErrorCode::ProtocolError, "Unknown frame type"));
    }

    FrameHeader header;
    header.type = static_cast<FrameType>(bytes[3]);
    header.length = (static_cast<uint32_t>(bytes[4]) << 24) |
                    (static_cast<uint32_t>(bytes[5]) << 16) |
                    (static_cast<uint32_t>(bytes[6]) << 8) |
                    static_cast<uint32_t>(bytes[7]);
    if (header.length > FrameHeader::MAX_PAYLOAD) {
        return R::err(make_error(ErrorCode::ProtocolError, "Frame too large"));
    }
    return R::ok(header);
}

QByteArray encodeFrame(FrameType type, const QByteArray& payload) {
    FrameHeader header;
    header.type = type;
    header.length = static_cast<uint32_t>(payload.size());
    return serializeHeader(header) + payload;
}

Result<std::optional<Frame>, Error> FrameReader::next() {
    using R = Result<std::optional<Frame>, Error>;
    if (buffer_.size() < FrameHeader::HEADER_SIZE) {
        return R::ok(std::nullopt);
    }

    auto header = deserializeHeader(buffer_.left(FrameHeader::HEADER_SIZE));
    if (header.is_err()) {
        return R::err(header.unwrap_err());
    }

    const auto total = FrameHeader::HEADER_SIZE + static_cast<qsizetype>(header.unwrap().length);
    if (buffer_.size() < total) {
        return R::ok(std::nullopt);
    }

    Frame frame;
    frame.type = header.unwrap().type;
    frame.payload = buffer_.mid(FrameHeader::HEADER_SIZE, total - FrameHeader::HEADER_SIZE);
    buffer_.remove(0, total);
    return R::ok(std::move(frame));
}

} // namespace rally::network
