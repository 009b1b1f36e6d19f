#include <catch2/catch_test_macros.hpp>

#include "integration/harness.hpp"

#include <algorithm>

using namespace rally;
using rally::controllers::SyncController;
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

} // namespace

TEST_CASE("Rooms: three devices form a full mesh", "[integration][rooms]") {
    LocalRelay local;
    auto a = start_node(QStringLiteral("A"), local.port, DeviceRole::Organizer);
    auto b = start_node(QStringLiteral("B"), local.port);
    auto c = start_node(QStringLiteral("C"), local.port, DeviceRole::Spectator);
    EventLog a_events(*a);

    const auto room_id = create_room(*a);
    REQUIRE(a->isHost());
    REQUIRE(a->roomId() == room_id);
    REQUIRE(a_events.count(QStringLiteral("room-created")) == 1);

    join_room(*b, room_id);
    join_room(*c, room_id);
    REQUIRE(wait_for_mesh({a.get(), b.get(), c.get()}));

    REQUIRE_FALSE(b->isHost());
    REQUIRE(b->roomId() == room_id);
    REQUIRE(a_events.count(QStringLiteral("device-joined")) == 2);

    const auto status = b->status();
    REQUIRE(status.value("connection").toObject().value("hostDeviceId").toString() == a->deviceId());
    REQUIRE(status.value("connection").toObject().value("connectionStatus").toString() == QStringLiteral("connected"));
    REQUIRE(local.relay.members(room_id).size() == 3);
}

TEST_CASE("Rooms: room operations need an initialized controller", "[integration][rooms]") {
    SyncController idle;
    std::optional<Result<QString, Error>> created;
    idle.createRoom([&](Result<QString, Error> r) { created = std::move(r); });
    REQUIRE(created.has_value());
    REQUIRE(created->unwrap_err().is(ErrorCode::NotInitialized));

    auto submitted = idle.submitMutation(QStringLiteral("matches"), QStringLiteral("m1"),
                                         sync::MutationOp::Create, {{"court", 1}});
    REQUIRE(submitted.is_err());
    REQUIRE(submitted.unwrap_err().is(ErrorCode::NotInitialized));
}

TEST_CASE("Rooms: invalid configuration is rejected", "[integration][rooms]") {
    SyncController node;
    auto config = node_config(QStringLiteral("  "), 47900);
    auto initialized = node.initialize(config);
    REQUIRE(initialized.is_err());
    REQUIRE(initialized.unwrap_err().is(ErrorCode::InvalidArgument));
    REQUIRE_FALSE(node.isInitialized());
}

TEST_CASE("Rooms: one room at a time", "[integration][rooms]") {
    LocalRelay local;
    auto a = start_node(QStringLiteral("A"), local.port);
    create_room(*a);

    std::optional<Result<QString, Error>> second;
    a->createRoom([&](Result<QString, Error> r) { second = std::move(r); });
    REQUIRE(wait_until([&]() { return second.has_value(); }));
    REQUIRE(second->unwrap_err().is(ErrorCode::AlreadyInRoom));
}

TEST_CASE("Rooms: joining a room that does not exist", "[integration][rooms]") {
    LocalRelay local;
    auto b = start_node(QStringLiteral("B"), local.port);

    std::optional<Result<void, Error>> joined;
    b->joinRoom(QStringLiteral("room-1-zzzzzz"), [&](Result<void, Error> r) { joined = r; });
    REQUIRE(wait_until([&]() { return joined.has_value(); }));
    REQUIRE(joined->unwrap_err().is(ErrorCode::RoomNotFound));
    REQUIRE(b->roomId().isEmpty());
}

TEST_CASE("Rooms: open rooms can be listed", "[integration][rooms]") {
    LocalRelay local;
    auto a = start_node(QStringLiteral("A"), local.port);
    auto b = start_node(QStringLiteral("B"), local.port);
    const auto room_id = create_room(*a);

    std::optional<Result<std::vector<network::signaling::RoomSummary>, Error>> rooms;
    b->listAvailableRooms([&](auto r) { rooms = std::move(r); });
    REQUIRE(wait_until([&]() { return rooms.has_value(); }));
    REQUIRE(rooms->is_ok());
    REQUIRE(rooms->unwrap().size() == 1);
    REQUIRE(rooms->unwrap()[0].room_id == room_id);
    REQUIRE(rooms->unwrap()[0].member_count == 1);
}

TEST_CASE("Rooms: a member leaving shrinks the mesh", "[integration][rooms]") {
    LocalRelay local;
    auto a = start_node(QStringLiteral("A"), local.port);
    auto b = start_node(QStringLiteral("B"), local.port);
    auto c = start_node(QStringLiteral("C"), local.port);
    const auto room_id = create_room(*a);
    join_room(*b, room_id);
    join_room(*c, room_id);
    REQUIRE(wait_for_mesh({a.get(), b.get(), c.get()}));

    EventLog a_events(*a);
    c->leaveRoom();
    REQUIRE(c->roomId().isEmpty());
    REQUIRE(wait_until([&]() {
        return a_events.count(QStringLiteral("device-left")) == 1 && a->connectedDeviceCount() == 1;
    }));
    REQUIRE(wait_for_mesh({a.get(), b.get()}));
    REQUIRE(a->roomId() == room_id);
}

TEST_CASE("Rooms: host leaving ends the room for everyone", "[integration][rooms]") {
    LocalRelay local;
    auto a = start_node(QStringLiteral("A"), local.port);
    auto b = start_node(QStringLiteral("B"), local.port);
    auto c = start_node(QStringLiteral("C"), local.port);
    const auto room_id = create_room(*a);
    join_room(*b, room_id);
    join_room(*c, room_id);
    REQUIRE(wait_for_mesh({a.get(), b.get(), c.get()}));

    EventLog b_events(*b);
    EventLog c_events(*c);
    a->leaveRoom();

    REQUIRE(wait_until([&]() {
        return b_events.count(QStringLiteral("room-ended")) == 1 &&
               c_events.count(QStringLiteral("room-ended")) == 1;
    }));
    REQUIRE(b->roomId().isEmpty());
    REQUIRE(c->roomId().isEmpty());
    REQUIRE(b->connectedDeviceCount() == 0);
    REQUIRE(local.relay.rooms().empty());
}

TEST_CASE("Rooms: shutdown and initialize again keeps the device id", "[integration][rooms]") {
    LocalRelay local;
    auto a = start_node(QStringLiteral("A"), local.port);
    const auto id = a->deviceId();
    create_room(*a);

    a->shutdown();
    REQUIRE_FALSE(a->isInitialized());
    REQUIRE(a->roomId().isEmpty());

    REQUIRE(a->initialize(node_config(QStringLiteral("A"), local.port)).is_ok());
    REQUIRE(a->deviceId() == id);
    REQUIRE(a->listeningPort() != 0);
}

TEST_CASE("Rooms: leaving while a join is pending abandons it", "[integration][rooms]") {
    LocalRelay local;
    auto a = start_node(QStringLiteral("A"), local.port);
    auto b = start_node(QStringLiteral("B"), local.port);
    const auto room_id = create_room(*a);
    EventLog b_events(*b);

    const auto join_then_leave = [&]() {
        std::optional<Result<void, Error>> joined;
        b->joinRoom(room_id, [&](Result<void, Error> r) { joined = std::move(r); });
        b->leaveRoom();

        REQUIRE(wait_until([&]() { return joined.has_value(); }));
        REQUIRE(joined->is_err());
        REQUIRE(joined->unwrap_err().is(ErrorCode::NotInRoom));
        REQUIRE(b->roomId().isEmpty());

        QTest::qWait(200);
        REQUIRE(b->roomId().isEmpty());
        REQUIRE(b_events.count(QStringLiteral("room-joined")) == 0);
        REQUIRE(local.relay.members(room_id).size() == 1);
        REQUIRE(a->connectedDeviceCount() == 0);
    };

    SECTION("before the relay connection is up") {
        join_then_leave();
    }

    SECTION("with the relay connection already up") {
        std::optional<bool> listed;
        b->listAvailableRooms([&](auto rooms) { listed = rooms.is_ok(); });
        REQUIRE(wait_until([&]() { return listed.has_value(); }));
        REQUIRE(*listed);
        join_then_leave();
    }

    // Nothing is left in flight, so a fresh join goes through.
    join_room(*b, room_id);
    REQUIRE(wait_for_mesh({a.get(), b.get()}));
}
