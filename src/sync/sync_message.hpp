#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include <optional>

namespace rally::sync {

enum class MessageKind {
    Mutation,
    SnapshotRequest,
    SnapshotResponse,
    Ack
};

[[nodiscard]] QString messageKindName(MessageKind kind);
[[nodiscard]] std::optional<MessageKind> parseMessageKind(const QString& name);

/**
 * SyncMessage - the envelope carried over peer channels.
 *
 * `sequence` is the sender's mutation counter for Mutation messages and the
 * acknowledged sequence for Ack messages; it is zero for snapshot traffic.
 * `priority` is the sender's conflict priority (zero unless role priority
 * is in effect).
 */
struct SyncMessage {
    Uuid sender;
    uint64_t sequence = 0;
    MessageKind kind = MessageKind::Mutation;
    Timestamp timestamp;
    int priority = 0;
    QJsonObject payload;

    [[nodiscard]] QByteArray encode() const;
    [[nodiscard]] static Result<SyncMessage, Error> decode(const QByteArray& bytes);
};

} // namespace rally::sync
