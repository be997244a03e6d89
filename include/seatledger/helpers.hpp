#pragma once

#include <cstdint>
#include <string>
#include <google/protobuf/any.pb.h>
#include <google/protobuf/timestamp.pb.h>
#include "seatledger/ledger.pb.h"

namespace seatledger {

/**
 * Helper functions for working with ledger event types.
 */
namespace helpers {

constexpr const char* TYPE_URL_PREFIX = "type.googleapis.com/";

/**
 * Extract the type name from a type URL.
 */
inline std::string type_name_from_url(const std::string& type_url) {
    auto pos = type_url.rfind('/');
    return pos != std::string::npos ? type_url.substr(pos + 1) : type_url;
}

/**
 * Check if a type URL matches the given fully qualified type name.
 * @param type_url Full type URL (e.g., "type.googleapis.com/seatledger.SeatsBooked")
 * @param type_name Fully qualified type name (e.g., "seatledger.SeatsBooked")
 */
inline bool type_url_matches(const std::string& type_url, const std::string& type_name) {
    return type_url == std::string(TYPE_URL_PREFIX) + type_name;
}

/**
 * Calculate the next sequence number from an EventBook.
 */
inline int next_sequence(const EventBook* book) {
    if (!book || book->pages_size() == 0) return 0;
    return book->pages_size();
}

/**
 * Lowercase hex encoding of raw bytes.
 */
std::string to_hex(const std::string& bytes);

/**
 * Get the root UUID as hex string from an EventBook.
 */
std::string root_id_hex(const EventBook& book);

/**
 * Generate a random version 4 UUID.
 */
UUID random_uuid();

/**
 * Get the current timestamp as a protobuf Timestamp.
 */
google::protobuf::Timestamp now();

/**
 * Pack an event into an EventPage.
 */
template<typename T>
EventPage pack_event(const T& event_message, int sequence) {
    EventPage page;
    page.set_sequence(static_cast<uint32_t>(sequence));
    page.mutable_event()->PackFrom(event_message, TYPE_URL_PREFIX);
    *page.mutable_created_at() = now();
    return page;
}

} // namespace helpers
} // namespace seatledger
