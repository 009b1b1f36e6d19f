#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>

#include "unit/fake_peer_channel.hpp"
#include "sync/sync_engine.hpp"

#include <algorithm>
#include <random>
#include <set>

using namespace rally;
using namespace rally::sync;
using rally::testing::FakePeerChannel;

namespace {

QByteArray mutation_envelope(const Uuid& sender, uint64_t seq) {
    Mutation m;
    m.collection = QStringLiteral("events");
    m.entity_id = QStringLiteral("e%1").arg(seq);
    m.op = MutationOp::Create;
    m.fields = QJsonObject{{"n", static_cast<int>(seq)}};

    SyncMessage msg;
    msg.sender = sender;
    msg.sequence = seq;
    msg.kind = MessageKind::Mutation;
    msg.timestamp = Timestamp(5000 + static_cast<int64_t>(seq));
    msg.payload = m.toJson();
    return msg.encode();
}

} // namespace

TEST_CASE("Property: remote mutations apply once and in sender order", "[property][engine]") {
    rc::check("shuffled delivery with duplicates applies 1..n exactly once, in order",
        []() {
            const auto n = *rc::gen::inRange<uint64_t>(1, 25);
            std::vector<uint64_t> deliveries;
            for (uint64_t seq = 1; seq <= n; ++seq) {
                deliveries.push_back(seq);
            }
            const auto duplicates = *rc::gen::container<std::vector<uint64_t>>(rc::gen::inRange<uint64_t>(1, n + 1));
            deliveries.insert(deliveries.end(), duplicates.begin(), duplicates.end());
            std::shuffle(deliveries.begin(), deliveries.end(), std::mt19937(*rc::gen::arbitrary<unsigned>()));

            FakePeerChannel peers;
            const auto x = Uuid::generate();
            peers.connected_ = {x};
            SyncEngine engine(peers);

            std::vector<QString> applied;
            QObject::connect(&engine, &SyncEngine::mutationApplied,
                             [&](const QString&, const QString& id, const Uuid&) { applied.push_back(id); });

            for (const auto seq : deliveries) {
                engine.handleEnvelope(x, mutation_envelope(x, seq));
            }

            std::vector<QString> expected;
            for (uint64_t seq = 1; seq <= n; ++seq) {
                expected.push_back(QStringLiteral("e%1").arg(seq));
            }
            RC_ASSERT(applied == expected);
            RC_ASSERT(engine.lastApplied(x) == n);
            RC_ASSERT(engine.bufferedCount(x) == 0u);
            RC_ASSERT_FALSE(engine.isResyncing(x));
            RC_ASSERT(engine.replica().entityCount() == static_cast<size_t>(n));

            std::set<uint64_t> acked;
            for (const auto& ack : peers.sentTo(x, MessageKind::Ack)) {
                acked.insert(ack.sequence);
            }
            RC_ASSERT(acked.size() == static_cast<size_t>(n));
        });
}

TEST_CASE("Property: local mutations are numbered and stamped in order", "[property][engine]") {
    rc::check("k submits produce sequences 1..k with increasing timestamps",
        []() {
            const auto k = *rc::gen::inRange(1, 40);
            FakePeerChannel peers;
            SyncEngine engine(peers);

            std::vector<SyncMessage> sent;
            QObject::connect(&engine, &SyncEngine::outboundReady, [&](const OutboundMutation& out) {
                sent.push_back(SyncMessage::decode(out.envelope).unwrap());
            });

            for (int i = 0; i < k; ++i) {
                Mutation m;
                m.collection = QStringLiteral("matches");
                m.entity_id = QStringLiteral("m%1").arg(i % 3);
                m.op = MutationOp::Update;
                m.fields = QJsonObject{{"score", i}};
                RC_ASSERT(engine.submit(m).is_ok());
            }

            RC_ASSERT(sent.size() == static_cast<size_t>(k));
            for (size_t i = 0; i < sent.size(); ++i) {
                RC_ASSERT(sent[i].sequence == i + 1);
                if (i > 0) {
                    RC_ASSERT(sent[i].timestamp > sent[i - 1].timestamp);
                }
            }
            // Each entity ends with its last local write.
            const auto last = engine.replica().entity(QStringLiteral("matches"), QStringLiteral("m%1").arg((k - 1) % 3));
            RC_ASSERT(last.has_value());
            RC_ASSERT(last->value("score").toInt() == k - 1);
        });
}
