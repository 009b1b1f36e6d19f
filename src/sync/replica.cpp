#include "sync/replica.hpp"

#include "core/device.hpp"

namespace rally::sync {

QJsonObject Stamp::toJson() const {
    QJsonObject obj;
    obj["priority"] = priority;
    obj["timestamp"] = static_cast<double>(timestamp);
    obj["sender"] = idString(sender);
    obj["sequence"] = static_cast<double>(sequence);
    return obj;
}

std::optional<Stamp> Stamp::fromJson(const QJsonObject& obj) {
    const auto sender = parseId(obj.value("sender").toString());
    if (!sender) {
        return std::nullopt;
    }
    Stamp stamp;
    stamp.priority = obj.value("priority").toInt();
    stamp.timestamp = static_cast<int64_t>(obj.value("timestamp").toDouble());
    stamp.sender = *sender;
    stamp.sequence = static_cast<uint64_t>(obj.value("sequence").toDouble());
    return stamp;
}

QString mutationOpName(MutationOp op) {
    switch (op) {
        case MutationOp::Create: return QStringLiteral("create");
        case MutationOp::Update: return QStringLiteral("update");
        case MutationOp::Delete: return QStringLiteral("delete");
    }
    return QStringLiteral("update");
}

std::optional<MutationOp> parseMutationOp(const QString& name) {
    if (name == QLatin1String("create")) return MutationOp::Create;
    if (name == QLatin1String("update")) return MutationOp::Update;
    if (name == QLatin1String("delete")) return MutationOp::Delete;
    return std::nullopt;
}

Result<void, Error> Mutation::validate() const {
    using R = Result<void, Error>;
    if (!Replica::isKnownCollection(collection)) {
        return R::err(make_error(ErrorCode::InvalidArgument,
                                 "Unknown collection: " + collection.toStdString()));
    }
    if (entity_id.trimmed().isEmpty()) {
        return R::err(make_error(ErrorCode::InvalidArgument, "Entity id is empty"));
    }
    if (op == MutationOp::Update && fields.isEmpty()) {
        return R::err(make_error(ErrorCode::InvalidArgument, "Update without fields"));
    }
    return R::ok();
}

QJsonObject Mutation::toJson() const {
    QJsonObject obj;
    obj["collection"] = collection;
    obj["entityId"] = entity_id;
    obj["op"] = mutationOpName(op);
    if (op != MutationOp::Delete) {
        obj["fields"] = fields;
    }
    return obj;
}

Result<Mutation, Error> Mutation::fromJson(const QJsonObject& obj) {
    using R = Result<Mutation, Error>;
    const auto op = parseMutationOp(obj.value("op").toString());
    if (!op) {
        return R::err(make_error(ErrorCode::ProtocolError,
                                 "Unknown mutation op: " + obj.value("op").toString().toStdString()));
    }
    Mutation m;
    m.collection = obj.value("collection").toString();
    m.entity_id = obj.value("entityId").toString();
    m.op = *op;
    m.fields = obj.value("fields").toObject();

    auto valid = m.validate();
    if (valid.is_err()) {
        return R::err(make_error(ErrorCode::ProtocolError, valid.unwrap_err().message));
    }
    return R::ok(std::move(m));
}

QJsonObject EntityRecord::view() const {
    QJsonObject obj;
    for (const auto& [name, field] : fields) {
        obj[name] = field.value;
    }
    return obj;
}

const QStringList& Replica::collections() {
    static const QStringList names{
        QStringLiteral("tournaments"),
        QStringLiteral("matches"),
        QStringLiteral("teams"),
        QStringLiteral("events"),
    };
    return names;
}

bool Replica::isKnownCollection(const QString& name) {
    return collections().contains(name);
}

bool Replica::writeField(EntityRecord& record, const QString& name,
                         const QJsonValue& value, const Stamp& stamp) {
    if (record.tombstone && stamp <= *record.tombstone) {
        return false;
    }
    auto it = record.fields.find(name);
    if (it != record.fields.end() && stamp <= it->second.stamp) {
        return false;
    }
    record.fields[name] = FieldValue{value, stamp};
    return true;
}

bool Replica::writeTombstone(EntityRecord& record, const Stamp& stamp) {
    if (record.tombstone && stamp <= *record.tombstone) {
        return false;
    }
    record.tombstone = stamp;
    for (auto it = record.fields.begin(); it != record.fields.end();) {
        if (it->second.stamp < stamp) {
            it = record.fields.erase(it);
        } else {
            ++it;
        }
    }
    return true;
}

bool Replica::apply(const Mutation& mutation, const Stamp& stamp) {
    auto& record = collections_[mutation.collection][mutation.entity_id];

    if (mutation.op == MutationOp::Delete) {
        return writeTombstone(record, stamp);
    }

    bool changed = false;
    if (mutation.op == MutationOp::Create && !mutation.fields.contains(QStringLiteral("id"))) {
        changed |= writeField(record, QStringLiteral("id"), mutation.entity_id, stamp);
    }
    for (auto it = mutation.fields.begin(); it != mutation.fields.end(); ++it) {
        changed |= writeField(record, it.key(), it.value(), stamp);
    }
    return changed;
}

void Replica::merge(const Replica& other) {
    for (const auto& [collection, entities] : other.collections_) {
        auto& mine = collections_[collection];
        for (const auto& [id, theirs] : entities) {
            auto& record = mine[id];
            if (theirs.tombstone) {
                writeTombstone(record, *theirs.tombstone);
            }
            for (const auto& [name, field] : theirs.fields) {
                writeField(record, name, field.value, field.stamp);
            }
        }
    }
}

std::optional<QJsonObject> Replica::entity(const QString& collection, const QString& id) const {
    auto c = collections_.find(collection);
    if (c == collections_.end()) {
        return std::nullopt;
    }
    auto e = c->second.find(id);
    if (e == c->second.end() || !e->second.visible()) {
        return std::nullopt;
    }
    return e->second.view();
}

size_t Replica::entityCount() const {
    size_t count = 0;
    for (const auto& [collection, entities] : collections_) {
        for (const auto& [id, record] : entities) {
            if (record.visible()) ++count;
        }
    }
    return count;
}

QJsonObject Replica::view() const {
    QJsonObject out;
    for (const auto& name : collections()) {
        out[name] = QJsonObject{};
    }
    for (const auto& [collection, entities] : collections_) {
        QJsonObject items;
        for (const auto& [id, record] : entities) {
            if (record.visible()) {
                items[id] = record.view();
            }
        }
        out[collection] = items;
    }
    return out;
}

QJsonObject Replica::toJson() const {
    QJsonObject out;
    for (const auto& [collection, entities] : collections_) {
        QJsonObject items;
        for (const auto& [id, record] : entities) {
            if (!record.visible() && !record.tombstone) {
                continue;
            }
            QJsonObject fields;
            for (const auto& [name, field] : record.fields) {
                QJsonObject f;
                f["value"] = field.value;
                f["stamp"] = field.stamp.toJson();
                fields[name] = f;
            }
            QJsonObject entry;
            entry["fields"] = fields;
            if (record.tombstone) {
                entry["tombstone"] = record.tombstone->toJson();
            }
            items[id] = entry;
        }
        if (!items.isEmpty()) {
            out[collection] = items;
        }
    }
    return out;
}

Result<Replica, Error> Replica::fromJson(const QJsonObject& obj) {
    using R = Result<Replica, Error>;
    Replica replica;
    for (auto c = obj.begin(); c != obj.end(); ++c) {
        if (!isKnownCollection(c.key())) {
            return R::err(make_error(ErrorCode::ProtocolError,
                                     "Unknown collection in snapshot: " + c.key().toStdString()));
        }
        auto& entities = replica.collections_[c.key()];
        const auto items = c.value().toObject();
        for (auto e = items.begin(); e != items.end(); ++e) {
            const auto entry = e.value().toObject();
            EntityRecord record;
            if (entry.contains("tombstone")) {
                auto tombstone = Stamp::fromJson(entry.value("tombstone").toObject());
                if (!tombstone) {
                    return R::err(make_error(ErrorCode::ProtocolError, "Malformed tombstone stamp"));
                }
                record.tombstone = *tombstone;
            }
            const auto fields = entry.value("fields").toObject();
            for (auto f = fields.begin(); f != fields.end(); ++f) {
                const auto field = f.value().toObject();
                auto stamp = Stamp::fromJson(field.value("stamp").toObject());
                if (!stamp) {
                    return R::err(make_error(ErrorCode::ProtocolError, "Malformed field stamp"));
                }
                record.fields[f.key()] = FieldValue{field.value("value"), *stamp};
            }
            entities[e.key()] = std::move(record);
        }
    }
    return R::ok(std::move(replica));
}

} // namespace rally::sync
