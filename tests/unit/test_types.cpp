#include <catch2/catch_test_macros.hpp>
#include "core/device.hpp"
#include "core/types.hpp"

#include <set>

using namespace rally;

TEST_CASE("Uuid::generate is unique and version 4", "[types][uuid]") {
    std::set<Uuid> ids;
    for (int i = 0; i < 200; ++i) {
        auto id = Uuid::generate();
        REQUIRE_FALSE(id.is_nil());
        REQUIRE((id.bytes()[6] >> 4) == 4);
        ids.insert(id);
    }
    REQUIRE(ids.size() == 200);
}

TEST_CASE("Uuid parses its own string form", "[types][uuid]") {
    auto id = Uuid::generate();
    auto text = id.to_string();

    REQUIRE(text.size() == 36);
    REQUIRE(text[8] == '-');
    auto parsed = Uuid::parse(text);
    REQUIRE(parsed.has_value());
    REQUIRE(*parsed == id);
}

TEST_CASE("Uuid rejects malformed input", "[types][uuid]") {
    REQUIRE_FALSE(Uuid::parse("").has_value());
    REQUIRE_FALSE(Uuid::parse("not-a-uuid").has_value());
    REQUIRE_FALSE(Uuid::parse("0123456789abcdef0123456789abcdeg").has_value());
}

TEST_CASE("Timestamp formats ISO 8601 in UTC", "[types][timestamp]") {
    Timestamp ts(1714557600250);
    REQUIRE(ts.to_iso_string() == "2024-05-01T10:00:00.250Z");
    REQUIRE(Timestamp{}.is_zero());
    REQUIRE((ts + std::chrono::milliseconds(750)).millis() == 1714557601000);
}

TEST_CASE("Device roles round-trip by name", "[types][device]") {
    for (auto role : {DeviceRole::Referee, DeviceRole::Organizer, DeviceRole::Spectator}) {
        REQUIRE(parseRole(roleName(role)) == role);
    }
    REQUIRE(parseRole(QStringLiteral(" Referee ")) == DeviceRole::Referee);
    REQUIRE_FALSE(parseRole(QStringLiteral("coach")).has_value());
    REQUIRE(rolePriority(DeviceRole::Referee) > rolePriority(DeviceRole::Organizer));
    REQUIRE(rolePriority(DeviceRole::Organizer) > rolePriority(DeviceRole::Spectator));
}

TEST_CASE("DeviceInfo JSON requires a valid id", "[types][device]") {
    DeviceInfo info{Uuid::generate(), QStringLiteral("Court 1"), DeviceRole::Referee};
    auto back = DeviceInfo::fromJson(info.toJson());
    REQUIRE(back.has_value());
    REQUIRE(*back == info);

    QJsonObject missing;
    missing["name"] = QStringLiteral("x");
    REQUIRE_FALSE(DeviceInfo::fromJson(missing).has_value());

    QJsonObject unknown_role = info.toJson();
    unknown_role["role"] = QStringLiteral("mascot");
    REQUIRE(DeviceInfo::fromJson(unknown_role)->role == DeviceRole::Spectator);
}
