#include <catch2/catch_test_macros.hpp>
#include "sync/replica.hpp"

using namespace rally;
using namespace rally::sync;

namespace {

Mutation make(MutationOp op, const QString& id, QJsonObject fields = {}) {
    Mutation m;
    m.collection = QStringLiteral("matches");
    m.entity_id = id;
    m.op = op;
    m.fields = std::move(fields);
    return m;
}

Stamp stamp_at(int64_t ts, const Uuid& sender, uint64_t seq = 1, int priority = 0) {
    return Stamp{priority, ts, sender, seq};
}

} // namespace

TEST_CASE("Mutation validation", "[sync][replica]") {
    REQUIRE(make(MutationOp::Create, QStringLiteral("m1")).validate().is_ok());
    REQUIRE(make(MutationOp::Delete, QStringLiteral("m1")).validate().is_ok());
    REQUIRE(make(MutationOp::Update, QStringLiteral("m1")).validate().is_err());
    REQUIRE(make(MutationOp::Create, QStringLiteral("  ")).validate().is_err());

    auto unknown = make(MutationOp::Create, QStringLiteral("x"));
    unknown.collection = QStringLiteral("players");
    REQUIRE(unknown.validate().unwrap_err().is(ErrorCode::InvalidArgument));

    auto wire = make(MutationOp::Update, QStringLiteral("m1"), {{"score", 3}}).toJson();
    REQUIRE(wire.value("entityId").toString() == QStringLiteral("m1"));
    REQUIRE(wire.value("op").toString() == QStringLiteral("update"));
    wire["op"] = QStringLiteral("upsert");
    REQUIRE(Mutation::fromJson(wire).unwrap_err().is(ErrorCode::ProtocolError));
}

TEST_CASE("Create then update builds the entity", "[sync][replica]") {
    Replica replica;
    const auto a = Uuid::generate();

    REQUIRE(replica.apply(make(MutationOp::Create, QStringLiteral("m1"), {{"court", 1}}), stamp_at(100, a, 1)));
    REQUIRE(replica.apply(make(MutationOp::Update, QStringLiteral("m1"), {{"score", "2-1"}}), stamp_at(101, a, 2)));

    auto entity = replica.entity(QStringLiteral("matches"), QStringLiteral("m1"));
    REQUIRE(entity.has_value());
    REQUIRE(entity->value("id").toString() == QStringLiteral("m1"));
    REQUIRE(entity->value("court").toInt() == 1);
    REQUIRE(entity->value("score").toString() == QStringLiteral("2-1"));
    REQUIRE(replica.entityCount() == 1);
}

TEST_CASE("Concurrent writes to one field: later timestamp wins", "[sync][replica]") {
    const auto x = Uuid::generate();
    const auto y = Uuid::generate();
    const auto older = make(MutationOp::Update, QStringLiteral("m1"), {{"score", "1-0"}});
    const auto newer = make(MutationOp::Update, QStringLiteral("m1"), {{"score", "0-1"}});

    Replica forward;
    forward.apply(older, stamp_at(100, x));
    forward.apply(newer, stamp_at(200, y));

    Replica backward;
    backward.apply(newer, stamp_at(200, y));
    REQUIRE_FALSE(backward.apply(older, stamp_at(100, x)));

    REQUIRE(forward == backward);
    REQUIRE(forward.entity(QStringLiteral("matches"), QStringLiteral("m1"))->value("score").toString() ==
            QStringLiteral("0-1"));
}

TEST_CASE("Timestamp ties break on sender id", "[sync][replica]") {
    auto a = Uuid::generate();
    auto b = Uuid::generate();
    if (b < a) std::swap(a, b);

    Replica one;
    one.apply(make(MutationOp::Update, QStringLiteral("m1"), {{"court", 1}}), stamp_at(500, a));
    one.apply(make(MutationOp::Update, QStringLiteral("m1"), {{"court", 2}}), stamp_at(500, b));

    Replica two;
    two.apply(make(MutationOp::Update, QStringLiteral("m1"), {{"court", 2}}), stamp_at(500, b));
    two.apply(make(MutationOp::Update, QStringLiteral("m1"), {{"court", 1}}), stamp_at(500, a));

    REQUIRE(one == two);
    REQUIRE(one.entity(QStringLiteral("matches"), QStringLiteral("m1"))->value("court").toInt() == 2);
}

TEST_CASE("Writes to different fields of one entity both survive", "[sync][replica]") {
    Replica replica;
    replica.apply(make(MutationOp::Update, QStringLiteral("m1"), {{"court", 4}}), stamp_at(300, Uuid::generate()));
    replica.apply(make(MutationOp::Update, QStringLiteral("m1"), {{"status", "live"}}), stamp_at(200, Uuid::generate()));

    auto entity = replica.entity(QStringLiteral("matches"), QStringLiteral("m1"));
    REQUIRE(entity->value("court").toInt() == 4);
    REQUIRE(entity->value("status").toString() == QStringLiteral("live"));
}

TEST_CASE("Role priority outranks a later timestamp", "[sync][replica]") {
    Replica replica;
    const auto referee = Uuid::generate();
    const auto spectator = Uuid::generate();
    replica.apply(make(MutationOp::Update, QStringLiteral("m1"), {{"score", "3-2"}}),
                  stamp_at(100, referee, 1, 3));
    REQUIRE_FALSE(replica.apply(make(MutationOp::Update, QStringLiteral("m1"), {{"score", "0-0"}}),
                                stamp_at(900, spectator, 1, 1)));
    REQUIRE(replica.entity(QStringLiteral("matches"), QStringLiteral("m1"))->value("score").toString() ==
            QStringLiteral("3-2"));
}

TEST_CASE("Delete hides older fields but not newer ones", "[sync][replica]") {
    const auto a = Uuid::generate();
    Replica replica;
    replica.apply(make(MutationOp::Create, QStringLiteral("m1"), {{"court", 1}}), stamp_at(100, a, 1));
    REQUIRE(replica.apply(make(MutationOp::Delete, QStringLiteral("m1")), stamp_at(200, a, 2)));
    REQUIRE_FALSE(replica.entity(QStringLiteral("matches"), QStringLiteral("m1")).has_value());
    REQUIRE(replica.entityCount() == 0);

    // A stale write that raced the delete stays dead.
    REQUIRE_FALSE(replica.apply(make(MutationOp::Update, QStringLiteral("m1"), {{"court", 9}}),
                                stamp_at(150, Uuid::generate())));
    REQUIRE_FALSE(replica.entity(QStringLiteral("matches"), QStringLiteral("m1")).has_value());

    REQUIRE(replica.apply(make(MutationOp::Create, QStringLiteral("m1"), {{"court", 5}}), stamp_at(300, a, 3)));
    REQUIRE(replica.entity(QStringLiteral("matches"), QStringLiteral("m1"))->value("court").toInt() == 5);
}

TEST_CASE("Snapshot JSON keeps stamps and tombstones", "[sync][replica]") {
    const auto a = Uuid::generate();
    Replica replica;
    replica.apply(make(MutationOp::Create, QStringLiteral("m1"), {{"court", 1}}), stamp_at(100, a, 1));
    replica.apply(make(MutationOp::Create, QStringLiteral("m2"), {{"court", 2}}), stamp_at(110, a, 2));
    replica.apply(make(MutationOp::Delete, QStringLiteral("m2")), stamp_at(120, a, 3));

    auto restored = Replica::fromJson(replica.toJson());
    REQUIRE(restored.is_ok());
    REQUIRE(restored.unwrap() == replica);

    // The tombstone travels, so a late create with an older stamp stays dead.
    auto copy = restored.unwrap();
    REQUIRE_FALSE(copy.apply(make(MutationOp::Create, QStringLiteral("m2"), {{"court", 7}}), stamp_at(115, a, 9)));

    QJsonObject bogus;
    bogus["players"] = QJsonObject{};
    REQUIRE(Replica::fromJson(bogus).unwrap_err().is(ErrorCode::ProtocolError));
}

TEST_CASE("Merge is order independent", "[sync][replica]") {
    const auto x = Uuid::generate();
    const auto y = Uuid::generate();
    Replica left;
    left.apply(make(MutationOp::Create, QStringLiteral("m1"), {{"court", 1}}), stamp_at(100, x, 1));
    left.apply(make(MutationOp::Update, QStringLiteral("m1"), {{"score", "1-0"}}), stamp_at(300, x, 2));
    Replica right;
    right.apply(make(MutationOp::Update, QStringLiteral("m1"), {{"score", "0-1"}}), stamp_at(200, y, 1));
    right.apply(make(MutationOp::Create, QStringLiteral("m9"), {{"court", 9}}), stamp_at(210, y, 2));

    Replica a = left;
    a.merge(right);
    Replica b = right;
    b.merge(left);

    REQUIRE(a == b);
    REQUIRE(a.entity(QStringLiteral("matches"), QStringLiteral("m1"))->value("score").toString() ==
            QStringLiteral("1-0"));
    REQUIRE(a.entityCount() == 2);
}
