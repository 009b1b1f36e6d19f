#pragma once

#include <QJsonObject>
#include <QString>

#include "core/result.hpp"
#include "sync/replica.hpp"

namespace rally::cli {

enum class NodeCommandKind {
    Mutate,
    Show,
    State,
    Status,
    Rooms,
    Leave,
    Sync,
    Reconnect,
    Clear,
    NetworkDown,
    NetworkUp,
    Help,
    Quit
};

struct NodeCommand {
    NodeCommandKind kind = NodeCommandKind::Help;
    sync::MutationOp op = sync::MutationOp::Update;
    QString collection;
    QString entity_id;
    QJsonObject fields;
};

/**
 * Parse one line typed at the rally_node prompt.
 *
 *   create <collection> <id> [field=value ...]
 *   set <collection> <id> field=value [...]
 *   delete <collection> <id>
 *   show <collection> <id>
 *   state | status | rooms | leave | sync | reconnect | clear
 *   offline | online | help | quit
 *
 * Values that read as a number, true, false or null keep that type;
 * anything else is a string.
 */
[[nodiscard]] Result<NodeCommand> parse_node_command(const QString& line);

[[nodiscard]] QString node_help_text();

/**
 * One-line rendering of a facade event for stdout.
 */
[[nodiscard]] QString format_event(const QString& name, const QJsonObject& detail);

} // namespace rally::cli
