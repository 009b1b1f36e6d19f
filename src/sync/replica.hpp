#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <QStringList>
#include <map>
#include <optional>

namespace rally::sync {

/**
 * Stamp - orders concurrent writes to the same field.
 *
 * Compared lexicographically: priority, then send timestamp, then sender
 * id, then the sender's sequence. Every replica orders the same pair of
 * stamps the same way.
 */
struct Stamp {
    int priority = 0;
    int64_t timestamp = 0;
    Uuid sender;
    uint64_t sequence = 0;

    auto operator<=>(const Stamp&) const = default;
    bool operator==(const Stamp&) const = default;

    [[nodiscard]] QJsonObject toJson() const;
    [[nodiscard]] static std::optional<Stamp> fromJson(const QJsonObject& obj);
};

enum class MutationOp {
    Create,
    Update,
    Delete
};

[[nodiscard]] QString mutationOpName(MutationOp op);
[[nodiscard]] std::optional<MutationOp> parseMutationOp(const QString& name);

/**
 * Mutation - one change to one entity.
 */
struct Mutation {
    QString collection;
    QString entity_id;
    MutationOp op = MutationOp::Update;
    QJsonObject fields;

    [[nodiscard]] Result<void, Error> validate() const;
    [[nodiscard]] QJsonObject toJson() const;
    [[nodiscard]] static Result<Mutation, Error> fromJson(const QJsonObject& obj);

    [[nodiscard]] QString entityRef() const { return collection + QLatin1Char('/') + entity_id; }
};

struct FieldValue {
    QJsonValue value;
    Stamp stamp;
};

struct EntityRecord {
    std::map<QString, FieldValue> fields;
    std::optional<Stamp> tombstone;

    [[nodiscard]] bool visible() const { return !fields.empty(); }
    [[nodiscard]] QJsonObject view() const;
};

/**
 * Replica - the local copy of the shared tournament state.
 *
 * Field-level last-write-wins: a field value or a deletion tombstone only
 * replaces what is there when its stamp is greater. Applying the same
 * writes in any order yields the same replica.
 */
class Replica {
public:
    [[nodiscard]] static const QStringList& collections();
    [[nodiscard]] static bool isKnownCollection(const QString& name);

    /**
     * Returns true when anything changed.
     */
    bool apply(const Mutation& mutation, const Stamp& stamp);

    /**
     * Fold another replica into this one, field by field.
     */
    void merge(const Replica& other);

    void clear() { collections_.clear(); }

    [[nodiscard]] std::optional<QJsonObject> entity(const QString& collection, const QString& id) const;
    [[nodiscard]] size_t entityCount() const;

    /**
     * Visible state only: {collection: {entityId: {field: value}}}.
     */
    [[nodiscard]] QJsonObject view() const;

    /**
     * Full state including stamps and tombstones, as sent in snapshots.
     */
    [[nodiscard]] QJsonObject toJson() const;
    [[nodiscard]] static Result<Replica, Error> fromJson(const QJsonObject& obj);

    bool operator==(const Replica& other) const { return toJson() == other.toJson(); }

private:
    std::map<QString, std::map<QString, EntityRecord>> collections_;

    static bool writeField(EntityRecord& record, const QString& name,
                           const QJsonValue& value, const Stamp& stamp);
    static bool writeTombstone(EntityRecord& record, const Stamp& stamp);
};

} // namespace rally::sync
