#include <catch2/catch_test_macros.hpp>

#include "integration/harness.hpp"

#include <algorithm>

using namespace rally;
using rally::controllers::SyncController;
using rally::sync::MutationOp;
using namespace rally::testing;

namespace {

struct EventLog {
    std::vector<QString> names;

    explicit EventLog(SyncController& node) {
        QObject::connect(&node, &SyncController::event,
                         [this](const QString& name, const QJsonObject&) { names.push_back(name); });
    }

    [[nodiscard]] int count(const QString& name) const {
        return static_cast<int>(std::count(names.begin(), names.end(), name));
    }
};

bool has_entity(const SyncController& node, const QString& collection, const QString& id) {
    return node.entity(collection, id).has_value();
}

struct Room {
    LocalRelay local;
    std::unique_ptr<SyncController> a;
    std::unique_ptr<SyncController> b;
    std::unique_ptr<SyncController> c;
    QString id;

    Room() {
        a = start_node(QStringLiteral("A"), local.port, DeviceRole::Organizer);
        b = start_node(QStringLiteral("B"), local.port);
        c = start_node(QStringLiteral("C"), local.port);
        id = create_room(*a);
        join_room(*b, id);
        join_room(*c, id);
        REQUIRE(wait_for_mesh({a.get(), b.get(), c.get()}));
    }

    bool converged() const {
        return a->state() == b->state() && b->state() == c->state();
    }
};

} // namespace

TEST_CASE("Sync: a mutation reaches every member", "[integration][sync]") {
    Room room;
    EventLog c_events(*room.c);

    REQUIRE(room.b->submitMutation(QStringLiteral("matches"), QStringLiteral("m1"), MutationOp::Create,
                                   {{"court", 2}, {"status", "scheduled"}}).is_ok());

    REQUIRE(wait_until([&]() {
        return has_entity(*room.a, "matches", "m1") && has_entity(*room.c, "matches", "m1");
    }));
    REQUIRE(room.a->entity("matches", "m1")->value("court").toInt() == 2);
    REQUIRE(c_events.count(QStringLiteral("remote-mutation")) == 1);
    REQUIRE(room.converged());
}

TEST_CASE("Sync: updates and deletes converge", "[integration][sync]") {
    Room room;
    REQUIRE(room.a->submitMutation("teams", "t1", MutationOp::Create, {{"name", "Hawks"}}).is_ok());
    REQUIRE(room.a->submitMutation("teams", "t2", MutationOp::Create, {{"name", "Owls"}}).is_ok());
    REQUIRE(wait_until([&]() { return has_entity(*room.c, "teams", "t2"); }));

    REQUIRE(room.c->submitMutation("teams", "t1", MutationOp::Update, {{"seed", 1}}).is_ok());
    REQUIRE(room.b->submitMutation("teams", "t2", MutationOp::Delete).is_ok());

    REQUIRE(wait_until([&]() {
        return !has_entity(*room.a, "teams", "t2") && !has_entity(*room.c, "teams", "t2") &&
               room.a->entity("teams", "t1")->value("seed").toInt() == 1 &&
               room.b->entity("teams", "t1") && room.b->entity("teams", "t1")->value("seed").toInt() == 1;
    }));
    REQUIRE(room.a->entity("teams", "t1")->value("name").toString() == QStringLiteral("Hawks"));
    REQUIRE(room.converged());
}

TEST_CASE("Sync: concurrent writes to one field settle on one value", "[integration][sync]") {
    Room room;
    REQUIRE(room.a->submitMutation("matches", "m1", MutationOp::Create, {{"score", "0-0"}}).is_ok());
    REQUIRE(wait_until([&]() { return has_entity(*room.b, "matches", "m1") && has_entity(*room.c, "matches", "m1"); }));

    REQUIRE(room.b->submitMutation("matches", "m1", MutationOp::Update, {{"score", "1-0"}}).is_ok());
    REQUIRE(room.c->submitMutation("matches", "m1", MutationOp::Update, {{"score", "0-1"}}).is_ok());

    REQUIRE(wait_until([&]() {
        const auto score = room.a->entity("matches", "m1")->value("score").toString();
        return score != QStringLiteral("0-0") && room.converged();
    }));
}

TEST_CASE("Sync: late joiner receives existing state", "[integration][sync]") {
    LocalRelay local;
    auto a = start_node(QStringLiteral("A"), local.port, DeviceRole::Organizer);
    auto b = start_node(QStringLiteral("B"), local.port);
    const auto room_id = create_room(*a);

    REQUIRE(a->submitMutation("tournaments", "cup", MutationOp::Create, {{"name", "Spring Cup"}}).is_ok());
    REQUIRE(a->submitMutation("events", "e1", MutationOp::Create, {{"kind", "start"}}).is_ok());

    EventLog b_events(*b);
    join_room(*b, room_id);
    REQUIRE(wait_until([&]() {
        return has_entity(*b, "tournaments", "cup") && has_entity(*b, "events", "e1");
    }));
    REQUIRE(b_events.count(QStringLiteral("snapshot-applied")) >= 1);

    // Subsequent mutations from the host continue in sequence.
    REQUIRE(a->submitMutation("events", "e2", MutationOp::Create, {{"kind", "goal"}}).is_ok());
    REQUIRE(wait_until([&]() { return has_entity(*b, "events", "e2"); }));
    REQUIRE(a->state() == b->state());
}

TEST_CASE("Sync: mutations made offline are delivered after reconnecting", "[integration][sync]") {
    Room room;
    EventLog b_events(*room.b);

    room.b->reportNetworkStatus(false);
    REQUIRE_FALSE(room.b->isOnline());
    REQUIRE(b_events.count(QStringLiteral("went-offline")) == 1);

    REQUIRE(room.b->submitMutation("matches", "m1", MutationOp::Create, {{"court", 1}}).is_ok());
    REQUIRE(room.b->submitMutation("matches", "m1", MutationOp::Update, {{"court", 4}}).is_ok());
    REQUIRE(room.b->offlineQueueSize() == 2);
    REQUIRE(b_events.count(QStringLiteral("operation-queued")) == 2);
    REQUIRE(has_entity(*room.b, "matches", "m1"));

    QTest::qWait(200);
    REQUIRE_FALSE(has_entity(*room.a, "matches", "m1"));

    room.b->reportNetworkStatus(true);
    REQUIRE(wait_until([&]() {
        return room.b->offlineQueueSize() == 0 &&
               has_entity(*room.a, "matches", "m1") &&
               has_entity(*room.c, "matches", "m1");
    }));
    REQUIRE(room.b->isOnline());
    REQUIRE(b_events.count(QStringLiteral("back-online")) == 1);
    REQUIRE(b_events.count(QStringLiteral("operation-processed")) == 2);
    REQUIRE(room.a->entity("matches", "m1")->value("court").toInt() == 4);
    REQUIRE(room.converged());
}

TEST_CASE("Sync: manual mode holds mutations until asked", "[integration][sync]") {
    LocalRelay local;
    auto a = start_node(QStringLiteral("A"), local.port);
    auto b = std::make_unique<SyncController>();
    auto config = node_config(QStringLiteral("B"), local.port);
    config.enable_auto_sync = false;
    REQUIRE(b->initialize(config).is_ok());

    const auto room_id = create_room(*a);
    join_room(*b, room_id);
    REQUIRE(wait_for_mesh({a.get(), b.get()}));

    REQUIRE(b->submitMutation("matches", "m9", MutationOp::Create, {{"court", 9}}).is_ok());
    QTest::qWait(200);
    REQUIRE_FALSE(has_entity(*a, "matches", "m9"));

    b->manualSync();
    REQUIRE(wait_until([&]() { return has_entity(*a, "matches", "m9"); }));
}

TEST_CASE("Sync: invalid mutations are refused locally", "[integration][sync]") {
    LocalRelay local;
    auto a = start_node(QStringLiteral("A"), local.port);
    create_room(*a);

    auto r = a->submitMutation("brackets", "b1", MutationOp::Create, {{"x", 1}});
    REQUIRE(r.is_err());
    REQUIRE(r.unwrap_err().is(ErrorCode::InvalidArgument));
    REQUIRE(a->state().value("matches").toObject().isEmpty());
}
