#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include "seatledger/ledger.pb.h"

namespace seatledger {

/// Requested seats exceed the remaining seats. Nothing was changed.
struct OverbookingError {};

/// The passenger has no booking on this flight. Nothing was changed.
struct BookingNotFoundError {};

/// The cancelled seat count cannot be matched against the passenger's
/// bookings under the configured policy. Nothing was changed.
struct SeatCountMismatchError {
    int32_t booked_seats = 0;
    int32_t requested_seats = 0;
};

enum class ErrorCode {
    None,
    Overbooking,
    BookingNotFound,
    SeatCountMismatch,
};

/// Success carries the recorded event.
using BookOutcome = std::variant<SeatsBooked, OverbookingError>;
using CancelOutcome = std::variant<BookedSeatsCancelled, BookingNotFoundError, SeatCountMismatchError>;

inline bool succeeded(const BookOutcome& outcome) {
    return std::holds_alternative<SeatsBooked>(outcome);
}

inline bool succeeded(const CancelOutcome& outcome) {
    return std::holds_alternative<BookedSeatsCancelled>(outcome);
}

ErrorCode error_code(const BookOutcome& outcome);
ErrorCode error_code(const CancelOutcome& outcome);

const char* to_string(ErrorCode code);

/// Human readable summary, e.g. for log lines or a presentation layer.
std::string describe(const BookOutcome& outcome);
std::string describe(const CancelOutcome& outcome);

} // namespace seatledger
