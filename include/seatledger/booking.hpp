#pragma once

#include <cstdint>
#include <string>

namespace seatledger {

/// One passenger's reservation of some number of seats.
struct Booking {
    std::string passenger;
    int32_t seat_count = 0;

    bool operator==(const Booking& other) const {
        return passenger == other.passenger && seat_count == other.seat_count;
    }
    bool operator!=(const Booking& other) const { return !(*this == other); }
};

} // namespace seatledger
