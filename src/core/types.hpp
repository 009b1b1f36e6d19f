#pragma once

#include <array>
#include <chrono>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace rally {

/**
 * Uuid - 128-bit identifier used for device ids and offline operation ids.
 *
 * Device ids are generated once per process instance; they are never
 * persisted, so two runs of the same client are two different devices.
 */
class Uuid {
public:
    static constexpr size_t BYTE_SIZE = 16;
    using Bytes = std::array<uint8_t, BYTE_SIZE>;

    constexpr Uuid() noexcept : bytes_{} {}
    explicit constexpr Uuid(Bytes bytes) noexcept : bytes_(bytes) {}

    /**
     * Generate a random (version 4) UUID.
     */
    [[nodiscard]] static Uuid generate();

    /**
     * Parse hyphenated or bare hex. Returns nullopt on malformed input.
     */
    [[nodiscard]] static std::optional<Uuid> parse(std::string_view str);

    /**
     * Lowercase hyphenated form: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
     */
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] constexpr bool is_nil() const noexcept {
        for (auto b : bytes_) {
            if (b != 0) return false;
        }
        return true;
    }

    [[nodiscard]] constexpr const Bytes& bytes() const noexcept { return bytes_; }

    auto operator<=>(const Uuid&) const = default;
    bool operator==(const Uuid&) const = default;

private:
    Bytes bytes_;
};

/**
 * Timestamp - milliseconds since the Unix epoch (wall clock).
 *
 * Sync stamps compare timestamps across devices, so this is deliberately
 * the system clock and not a monotonic one.
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;
    using Clock = std::chrono::system_clock;

    constexpr Timestamp() noexcept : millis_(0) {}
    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}

    [[nodiscard]] static Timestamp now() {
        return Timestamp(std::chrono::duration_cast<Duration>(
            Clock::now().time_since_epoch()).count());
    }

    [[nodiscard]] constexpr int64_t millis() const noexcept { return millis_; }
    [[nodiscard]] constexpr bool is_zero() const noexcept { return millis_ == 0; }

    /**
     * ISO 8601 in UTC with milliseconds, e.g. 2024-05-01T10:00:00.250Z
     */
    [[nodiscard]] std::string to_iso_string() const;

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

    Timestamp operator+(Duration d) const { return Timestamp(millis_ + d.count()); }
    Duration operator-(const Timestamp& other) const { return Duration(millis_ - other.millis_); }

private:
    int64_t millis_;
};

} // namespace rally

namespace std {
template<>
struct hash<rally::Uuid> {
    size_t operator()(const rally::Uuid& uuid) const noexcept {
        size_t h = 1469598103934665603ULL;
        for (auto b : uuid.bytes()) {
            h ^= b;
            h *= 1099511628211ULL;
        }
        return h;
    }
};
} // namespace std
