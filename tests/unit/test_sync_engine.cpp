#include <catch2/catch_test_macros.hpp>

#include <QTest>

#include "unit/fake_peer_channel.hpp"
#include "sync/sync_engine.hpp"

using namespace rally;
using namespace rally::sync;
using rally::testing::FakePeerChannel;

namespace {

Mutation create_match(const QString& id, QJsonObject fields = {{"court", 1}}) {
    Mutation m;
    m.collection = QStringLiteral("matches");
    m.entity_id = id;
    m.op = MutationOp::Create;
    m.fields = std::move(fields);
    return m;
}

SyncMessage remote_mutation(const Uuid& sender, uint64_t seq, const QString& id) {
    SyncMessage msg;
    msg.sender = sender;
    msg.sequence = seq;
    msg.kind = MessageKind::Mutation;
    msg.timestamp = Timestamp(1000 + static_cast<int64_t>(seq));
    msg.payload = create_match(id).toJson();
    return msg;
}

SyncMessage snapshot_from(const Uuid& sender, const Replica& state, const QJsonObject& applied) {
    SyncMessage msg;
    msg.sender = sender;
    msg.kind = MessageKind::SnapshotResponse;
    msg.timestamp = Timestamp::now();
    msg.payload = QJsonObject{{"state", state.toJson()}, {"applied", applied}};
    return msg;
}

struct Recorder {
    std::vector<OutboundMutation> outbound;
    std::vector<QString> applied;
    std::vector<Uuid> snapshots;
    std::vector<std::pair<Uuid, quint64>> acks;
    std::vector<Error> errors;

    explicit Recorder(SyncEngine& engine) {
        QObject::connect(&engine, &SyncEngine::outboundReady,
                         [this](const OutboundMutation& m) { outbound.push_back(m); });
        QObject::connect(&engine, &SyncEngine::mutationApplied,
                         [this](const QString&, const QString& id, const Uuid&) { applied.push_back(id); });
        QObject::connect(&engine, &SyncEngine::snapshotApplied,
                         [this](const Uuid& from) { snapshots.push_back(from); });
        QObject::connect(&engine, &SyncEngine::ackReceived,
                         [this](const Uuid& from, quint64 seq) { acks.emplace_back(from, seq); });
        QObject::connect(&engine, &SyncEngine::syncError,
                         [this](const Error& e) { errors.push_back(e); });
    }
};

} // namespace

TEST_CASE("SyncEngine: local mutations get consecutive sequence numbers", "[sync][engine]") {
    FakePeerChannel peers;
    const auto other = Uuid::generate();
    peers.connected_ = {other};
    SyncEngine engine(peers);
    Recorder rec(engine);

    REQUIRE(engine.submit(create_match(QStringLiteral("m1"))).is_ok());
    REQUIRE(engine.submit(create_match(QStringLiteral("m2"))).is_ok());

    REQUIRE(rec.outbound.size() == 2);
    const auto first = SyncMessage::decode(rec.outbound[0].envelope).unwrap();
    const auto second = SyncMessage::decode(rec.outbound[1].envelope).unwrap();
    REQUIRE(first.sender == peers.self_);
    REQUIRE(first.sequence == 1);
    REQUIRE(second.sequence == 2);
    REQUIRE(second.timestamp > first.timestamp);
    REQUIRE(rec.outbound[1].entity_ref == QStringLiteral("matches/m2"));
    REQUIRE(engine.replica().entity(QStringLiteral("matches"), QStringLiteral("m1")).has_value());
    REQUIRE(engine.localSequence() == 2);
}

TEST_CASE("SyncEngine: invalid mutations do not consume a sequence", "[sync][engine]") {
    FakePeerChannel peers;
    SyncEngine engine(peers);

    auto bad = create_match(QStringLiteral("m1"));
    bad.collection = QStringLiteral("players");
    auto r = engine.submit(bad);
    REQUIRE(r.is_err());
    REQUIRE(r.unwrap_err().is(ErrorCode::InvalidArgument));
    REQUIRE(engine.localSequence() == 0);
}

TEST_CASE("SyncEngine: manual mode holds mutations until manualSync", "[sync][engine]") {
    FakePeerChannel peers;
    const auto host = Uuid::generate();
    peers.host_ = host;
    peers.connected_ = {host};
    SyncEngine engine(peers);
    SyncEngine::Options options;
    options.auto_sync = false;
    engine.setOptions(options);
    Recorder rec(engine);

    REQUIRE(engine.submit(create_match(QStringLiteral("m1"))).is_ok());
    REQUIRE(rec.outbound.empty());
    REQUIRE(engine.pendingCount() == 1);
    REQUIRE(engine.replica().entity(QStringLiteral("matches"), QStringLiteral("m1")).has_value());

    engine.manualSync();
    REQUIRE(rec.outbound.size() == 1);
    REQUIRE(engine.pendingCount() == 0);
    REQUIRE(peers.sentTo(host, MessageKind::SnapshotRequest).size() == 1);
}

TEST_CASE("SyncEngine: in-order remote mutation is applied and acknowledged", "[sync][engine]") {
    FakePeerChannel peers;
    const auto x = Uuid::generate();
    peers.connected_ = {x};
    SyncEngine engine(peers);
    Recorder rec(engine);

    engine.handleEnvelope(x, remote_mutation(x, 1, QStringLiteral("m1")).encode());

    REQUIRE(rec.applied == std::vector<QString>{QStringLiteral("m1")});
    REQUIRE(engine.lastApplied(x) == 1);
    const auto acks = peers.sentTo(x, MessageKind::Ack);
    REQUIRE(acks.size() == 1);
    REQUIRE(acks[0].sequence == 1);
}

TEST_CASE("SyncEngine: redelivery of an applied sequence is a no-op", "[sync][engine]") {
    FakePeerChannel peers;
    const auto x = Uuid::generate();
    peers.connected_ = {x};
    SyncEngine engine(peers);
    Recorder rec(engine);

    const auto bytes = remote_mutation(x, 1, QStringLiteral("m1")).encode();
    engine.handleEnvelope(x, bytes);
    const auto before = engine.replica().toJson();
    engine.handleEnvelope(x, bytes);

    REQUIRE(rec.applied.size() == 1);
    REQUIRE(engine.replica().toJson() == before);
    // Still acknowledged, so a resending queue can move on.
    REQUIRE(peers.sentTo(x, MessageKind::Ack).size() == 2);
}

TEST_CASE("SyncEngine: gap is buffered until the snapshot arrives", "[sync][engine]") {
    FakePeerChannel peers;
    const auto x = Uuid::generate();
    peers.host_ = x;
    peers.connected_ = {x};
    SyncEngine engine(peers);
    Recorder rec(engine);

    engine.handleEnvelope(x, remote_mutation(x, 1, QStringLiteral("m1")).encode());
    engine.handleEnvelope(x, remote_mutation(x, 3, QStringLiteral("m3")).encode());
    engine.handleEnvelope(x, remote_mutation(x, 4, QStringLiteral("m4")).encode());

    REQUIRE(rec.applied == std::vector<QString>{QStringLiteral("m1")});
    REQUIRE(engine.bufferedCount(x) == 2);
    REQUIRE(engine.isResyncing(x));
    REQUIRE(peers.sentTo(x, MessageKind::SnapshotRequest).size() == 1);

    Replica host_state;
    host_state.apply(create_match(QStringLiteral("m1")), Stamp{0, 1001, x, 1});
    host_state.apply(create_match(QStringLiteral("m2")), Stamp{0, 1002, x, 2});
    engine.handleEnvelope(x, snapshot_from(x, host_state, {{idString(x), 2}}).encode());

    REQUIRE(rec.snapshots.size() == 1);
    REQUIRE(rec.applied == std::vector<QString>{QStringLiteral("m1"), QStringLiteral("m3"), QStringLiteral("m4")});
    REQUIRE(engine.lastApplied(x) == 4);
    REQUIRE(engine.bufferedCount(x) == 0);
    REQUIRE_FALSE(engine.isResyncing(x));
    REQUIRE(engine.replica().entityCount() == 4);
}

TEST_CASE("SyncEngine: late arrival of the missing sequence closes the gap", "[sync][engine]") {
    FakePeerChannel peers;
    const auto x = Uuid::generate();
    peers.connected_ = {x};
    SyncEngine engine(peers);
    Recorder rec(engine);

    engine.handleEnvelope(x, remote_mutation(x, 2, QStringLiteral("m2")).encode());
    engine.handleEnvelope(x, remote_mutation(x, 3, QStringLiteral("m3")).encode());
    REQUIRE(engine.isResyncing(x));

    engine.handleEnvelope(x, remote_mutation(x, 1, QStringLiteral("m1")).encode());
    REQUIRE(rec.applied == std::vector<QString>{QStringLiteral("m1"), QStringLiteral("m2"), QStringLiteral("m3")});
    REQUIRE(engine.bufferedCount(x) == 0);
    REQUIRE_FALSE(engine.isResyncing(x));
    REQUIRE(engine.lastApplied(x) == 3);
}

TEST_CASE("SyncEngine: snapshot supersedes buffered messages it already covers", "[sync][engine]") {
    FakePeerChannel peers;
    const auto x = Uuid::generate();
    peers.host_ = x;
    peers.connected_ = {x};
    SyncEngine engine(peers);
    Recorder rec(engine);

    engine.handleEnvelope(x, remote_mutation(x, 2, QStringLiteral("m2")).encode());
    REQUIRE(engine.bufferedCount(x) == 1);

    Replica host_state;
    host_state.apply(create_match(QStringLiteral("m1")), Stamp{0, 1001, x, 1});
    host_state.apply(create_match(QStringLiteral("m2")), Stamp{0, 1002, x, 2});
    engine.handleEnvelope(x, snapshot_from(x, host_state, {{idString(x), 2}}).encode());

    REQUIRE(rec.applied.empty());
    REQUIRE(engine.bufferedCount(x) == 0);
    REQUIRE(engine.lastApplied(x) == 2);
    const auto acks = peers.sentTo(x, MessageKind::Ack);
    REQUIRE(acks.size() == 1);
    REQUIRE(acks[0].sequence == 2);
}

TEST_CASE("SyncEngine: unanswered resync surfaces SequenceGap", "[sync][engine]") {
    FakePeerChannel peers;
    const auto x = Uuid::generate();
    peers.connected_ = {x};
    SyncEngine engine(peers);
    SyncEngine::Options options;
    options.resync_timeout_ms = 10;
    options.resync_max_attempts = 2;
    engine.setOptions(options);
    Recorder rec(engine);

    engine.handleEnvelope(x, remote_mutation(x, 5, QStringLiteral("m5")).encode());

    REQUIRE(QTest::qWaitFor([&]() { return !rec.errors.empty(); }, 2000));
    REQUIRE(rec.errors.front().is(ErrorCode::SequenceGap));
    REQUIRE(peers.sentTo(x, MessageKind::SnapshotRequest).size() == 2);
    REQUIRE_FALSE(engine.isResyncing(x));
}

TEST_CASE("SyncEngine: snapshot request is answered with state and clocks", "[sync][engine]") {
    FakePeerChannel peers;
    const auto b = Uuid::generate();
    peers.connected_ = {b};
    peers.host_ = peers.self_;
    SyncEngine engine(peers);

    REQUIRE(engine.submit(create_match(QStringLiteral("local"))).is_ok());
    engine.handleEnvelope(b, remote_mutation(b, 1, QStringLiteral("remote")).encode());

    SyncMessage request;
    request.sender = b;
    request.kind = MessageKind::SnapshotRequest;
    engine.handleEnvelope(b, request.encode());

    const auto responses = peers.sentTo(b, MessageKind::SnapshotResponse);
    REQUIRE(responses.size() == 1);
    const auto applied = responses[0].payload.value("applied").toObject();
    REQUIRE(applied.value(idString(peers.self_)).toInt() == 1);
    REQUIRE(applied.value(idString(b)).toInt() == 1);

    auto state = Replica::fromJson(responses[0].payload.value("state").toObject());
    REQUIRE(state.is_ok());
    REQUIRE(state.unwrap() == engine.replica());
}

TEST_CASE("SyncEngine: host snapshot keeps local writes the host has not seen", "[sync][engine]") {
    FakePeerChannel peers;
    const auto host = Uuid::generate();
    peers.host_ = host;
    peers.connected_ = {host};
    SyncEngine engine(peers);

    REQUIRE(engine.submit(create_match(QStringLiteral("mine"))).is_ok());

    Replica host_state;
    host_state.apply(create_match(QStringLiteral("theirs")), Stamp{0, 500, host, 1});
    engine.handleEnvelope(host, snapshot_from(host, host_state,
                                              {{idString(host), 1}, {idString(peers.self_), 0}}).encode());

    REQUIRE(engine.replica().entity(QStringLiteral("matches"), QStringLiteral("theirs")).has_value());
    REQUIRE(engine.replica().entity(QStringLiteral("matches"), QStringLiteral("mine")).has_value());
    REQUIRE(engine.lastApplied(host) == 1);
    // Own sequence is never taken from a snapshot.
    REQUIRE(engine.lastApplied(peers.self_) == 0);
}

TEST_CASE("SyncEngine: non-host snapshots are merged", "[sync][engine]") {
    FakePeerChannel peers;
    const auto member = Uuid::generate();
    peers.host_ = peers.self_;
    peers.connected_ = {member};
    SyncEngine engine(peers);
    REQUIRE(engine.submit(create_match(QStringLiteral("mine"))).is_ok());

    Replica member_state;
    member_state.apply(create_match(QStringLiteral("theirs")), Stamp{0, 500, member, 1});
    engine.handleEnvelope(member, snapshot_from(member, member_state, {{idString(member), 1}}).encode());

    REQUIRE(engine.replica().entityCount() == 2);
}

TEST_CASE("SyncEngine: envelope whose sender does not match the channel is dropped", "[sync][engine]") {
    FakePeerChannel peers;
    const auto x = Uuid::generate();
    const auto impostor = Uuid::generate();
    peers.connected_ = {x};
    SyncEngine engine(peers);
    Recorder rec(engine);

    engine.handleEnvelope(x, remote_mutation(impostor, 1, QStringLiteral("m1")).encode());
    engine.handleEnvelope(x, QByteArray("garbage"));

    REQUIRE(rec.applied.empty());
    REQUIRE(peers.sent_.empty());
}

TEST_CASE("SyncEngine: acknowledgements are reported", "[sync][engine]") {
    FakePeerChannel peers;
    const auto x = Uuid::generate();
    peers.connected_ = {x};
    SyncEngine engine(peers);
    Recorder rec(engine);

    SyncMessage ack;
    ack.sender = x;
    ack.kind = MessageKind::Ack;
    ack.sequence = 7;
    engine.handleEnvelope(x, ack.encode());

    REQUIRE(rec.acks.size() == 1);
    REQUIRE(rec.acks[0].first == x);
    REQUIRE(rec.acks[0].second == 7);
}

TEST_CASE("SyncEngine: unusable payload is skipped without stalling the sender", "[sync][engine]") {
    FakePeerChannel peers;
    const auto x = Uuid::generate();
    peers.connected_ = {x};
    SyncEngine engine(peers);
    Recorder rec(engine);

    auto broken = remote_mutation(x, 1, QStringLiteral("m1"));
    broken.payload["op"] = QStringLiteral("explode");
    engine.handleEnvelope(x, broken.encode());
    engine.handleEnvelope(x, remote_mutation(x, 2, QStringLiteral("m2")).encode());

    REQUIRE(rec.errors.size() == 1);
    REQUIRE(rec.errors[0].is(ErrorCode::ProtocolError));
    REQUIRE(rec.applied == std::vector<QString>{QStringLiteral("m2")});
    REQUIRE(engine.lastApplied(x) == 2);
}

TEST_CASE("SyncEngine: joining device asks the host for a snapshot", "[sync][engine]") {
    FakePeerChannel peers;
    const auto host = Uuid::generate();
    const auto member = Uuid::generate();
    peers.host_ = host;
    peers.connected_ = {host, member};
    SyncEngine engine(peers);

    engine.handleDeviceConnected(DeviceInfo{member, QStringLiteral("M"), DeviceRole::Spectator});
    REQUIRE(peers.sent_.empty());

    engine.handleDeviceConnected(DeviceInfo{host, QStringLiteral("H"), DeviceRole::Organizer});
    REQUIRE(peers.sentTo(host, MessageKind::SnapshotRequest).size() == 1);
}

TEST_CASE("SyncEngine: departed sender's buffer is dropped but its clock kept", "[sync][engine]") {
    FakePeerChannel peers;
    const auto x = Uuid::generate();
    peers.connected_ = {x};
    SyncEngine engine(peers);

    engine.handleEnvelope(x, remote_mutation(x, 1, QStringLiteral("m1")).encode());
    engine.handleEnvelope(x, remote_mutation(x, 3, QStringLiteral("m3")).encode());
    REQUIRE(engine.isResyncing(x));

    engine.handleDeviceLeft(x);
    REQUIRE(engine.bufferedCount(x) == 0);
    REQUIRE_FALSE(engine.isResyncing(x));
    REQUIRE(engine.lastApplied(x) == 1);
}

TEST_CASE("SyncEngine: replay log is trimmed to what the host has confirmed", "[sync][engine]") {
    FakePeerChannel peers;
    const auto host = Uuid::generate();
    const auto c = Uuid::generate();
    peers.host_ = host;
    peers.connected_ = {host, c};
    SyncEngine engine(peers);

    for (int i = 1; i <= 3; ++i) {
        REQUIRE(engine.submit(create_match(QStringLiteral("mine%1").arg(i))).is_ok());
    }
    engine.handleEnvelope(c, remote_mutation(c, 1, QStringLiteral("c1")).encode());
    engine.handleEnvelope(c, remote_mutation(c, 2, QStringLiteral("c2")).encode());
    REQUIRE(engine.historySize() == 5);

    SECTION("a host snapshot drops what its clocks cover") {
        Replica host_state;
        host_state.apply(create_match(QStringLiteral("c1")), Stamp{0, 1001, c, 1});
        engine.handleEnvelope(host, snapshot_from(host, host_state,
                                                  {{idString(host), 0},
                                                   {idString(peers.self_), 2},
                                                   {idString(c), 1}}).encode());

        REQUIRE(engine.historySize() == 2);
        // What the host had not seen was replayed.
        REQUIRE(engine.replica().entity(QStringLiteral("matches"), QStringLiteral("mine3")).has_value());
        REQUIRE(engine.replica().entity(QStringLiteral("matches"), QStringLiteral("c2")).has_value());
    }

    SECTION("a host ack drops own entries up to its sequence") {
        SyncMessage ack;
        ack.sender = host;
        ack.sequence = 2;
        ack.kind = MessageKind::Ack;
        ack.timestamp = Timestamp::now();
        engine.handleEnvelope(host, ack.encode());
        REQUIRE(engine.historySize() == 3);
    }

    SECTION("an ack from a member does not trim") {
        SyncMessage ack;
        ack.sender = c;
        ack.sequence = 3;
        ack.kind = MessageKind::Ack;
        ack.timestamp = Timestamp::now();
        engine.handleEnvelope(c, ack.encode());
        REQUIRE(engine.historySize() == 5);
    }
}

TEST_CASE("SyncEngine: replay log is bounded per sender", "[sync][engine]") {
    FakePeerChannel peers;
    peers.host_ = Uuid::generate();
    SyncEngine engine(peers);
    auto options = engine.options();
    options.max_history = 2;
    engine.setOptions(options);

    for (int i = 1; i <= 4; ++i) {
        REQUIRE(engine.submit(create_match(QStringLiteral("m%1").arg(i))).is_ok());
    }
    REQUIRE(engine.historySize() == 2);
    REQUIRE(engine.replica().entityCount() == 4);
}

TEST_CASE("SyncEngine: the host keeps no replay log", "[sync][engine]") {
    FakePeerChannel peers;
    const auto member = Uuid::generate();
    peers.host_ = peers.self_;
    peers.connected_ = {member};
    SyncEngine engine(peers);

    REQUIRE(engine.submit(create_match(QStringLiteral("mine"))).is_ok());
    engine.handleEnvelope(member, remote_mutation(member, 1, QStringLiteral("theirs")).encode());
    REQUIRE(engine.replica().entityCount() == 2);
    REQUIRE(engine.historySize() == 0);
}
