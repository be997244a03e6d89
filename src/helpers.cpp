#include "seatledger/helpers.hpp"

#include <chrono>
#include <random>

namespace seatledger {
namespace helpers {

std::string to_hex(const std::string& bytes) {
    std::string hex;
    hex.reserve(bytes.size() * 2);

    static const char hex_chars[] = "0123456789abcdef";
    for (unsigned char c : bytes) {
        hex.push_back(hex_chars[c >> 4]);
        hex.push_back(hex_chars[c & 0x0f]);
    }
    return hex;
}

std::string root_id_hex(const EventBook& book) {
    if (!book.has_cover() || !book.cover().has_root()) return "";
    return to_hex(book.cover().root().value());
}

UUID random_uuid() {
    thread_local std::mt19937_64 rng = [] {
        std::random_device rd;
        std::seed_seq seed{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
        return std::mt19937_64(seed);
    }();

    std::string bytes(16, '\0');
    for (size_t i = 0; i < bytes.size(); i += 8) {
        uint64_t chunk = rng();
        for (size_t j = 0; j < 8; j++) {
            bytes[i + j] = static_cast<char>((chunk >> (j * 8)) & 0xff);
        }
    }
    // Version 4, RFC 4122 variant
    bytes[6] = static_cast<char>((bytes[6] & 0x0f) | 0x40);
    bytes[8] = static_cast<char>((bytes[8] & 0x3f) | 0x80);

    UUID uuid;
    uuid.set_value(bytes);
    return uuid;
}

google::protobuf::Timestamp now() {
    auto time_point = std::chrono::system_clock::now();
    auto duration = time_point.time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(duration);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(duration - seconds);

    google::protobuf::Timestamp ts;
    ts.set_seconds(seconds.count());
    ts.set_nanos(static_cast<int32_t>(nanos.count()));
    return ts;
}

} // namespace helpers
} // namespace seatledger
