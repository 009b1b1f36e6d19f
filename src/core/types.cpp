#include "core/types.hpp"

#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace rally {

static_assert(sizeof(Uuid) == 16, "Uuid should be 16 bytes");
static_assert(std::is_trivially_copyable_v<Uuid>, "Uuid should be trivially copyable");
static_assert(std::is_trivially_copyable_v<Timestamp>, "Timestamp should be trivially copyable");

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

Uuid Uuid::generate() {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dist;

    Bytes bytes{};
    for (size_t half = 0; half < 2; ++half) {
        const uint64_t word = dist(gen);
        for (size_t i = 0; i < 8; ++i) {
            bytes[half * 8 + i] = static_cast<uint8_t>(word >> (i * 8));
        }
    }

    bytes[6] = (bytes[6] & 0x0F) | 0x40;  // version 4
    bytes[8] = (bytes[8] & 0x3F) | 0x80;  // RFC 4122 variant
    return Uuid(bytes);
}

std::optional<Uuid> Uuid::parse(std::string_view str) {
    Bytes bytes{};
    size_t nibbles = 0;
    for (char c : str) {
        if (c == '-') continue;
        const int v = hex_value(c);
        if (v < 0 || nibbles >= BYTE_SIZE * 2) {
            return std::nullopt;
        }
        if (nibbles % 2 == 0) {
            bytes[nibbles / 2] = static_cast<uint8_t>(v << 4);
        } else {
            bytes[nibbles / 2] |= static_cast<uint8_t>(v);
        }
        ++nibbles;
    }
    if (nibbles != BYTE_SIZE * 2) {
        return std::nullopt;
    }
    return Uuid(bytes);
}

std::string Uuid::to_string() const {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < BYTE_SIZE; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(bytes_[i]);
    }
    return oss.str();
}

std::string Timestamp::to_iso_string() const {
    const std::time_t secs = static_cast<std::time_t>(millis_ / 1000);
    const std::tm utc = *std::gmtime(&secs);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << (millis_ % 1000) << 'Z';
    return oss.str();
}

} // namespace rally
