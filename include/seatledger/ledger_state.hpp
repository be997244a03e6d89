#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <google/protobuf/any.pb.h>
#include "seatledger/booking.hpp"
#include "seatledger/ledger.pb.h"

namespace seatledger {

/// Seat inventory of one flight, derived from its events.
struct LedgerState {
    std::string flight_id;
    int32_t total_seats = 0;
    int32_t remaining_seats = 0;
    std::vector<Booking> bookings;

    bool exists() const { return !flight_id.empty(); }
    bool has_booking_for(const std::string& passenger) const;
    int32_t booked_seats_for(const std::string& passenger) const;

    /// Remaining seats after giving back `seats`, capped at total_seats.
    int32_t remaining_after_release(int32_t seats) const {
        return seats >= total_seats - remaining_seats ? total_seats : remaining_seats + seats;
    }

    /// Build state from an EventBook by applying all events.
    /// Throws InvalidEventError on an inconsistent history.
    static LedgerState from_event_book(const EventBook& event_book);

    /// Apply a single event to the state.
    static void apply_event(LedgerState& state, const google::protobuf::Any& event_any, int sequence);
};

} // namespace seatledger
