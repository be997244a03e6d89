#include "seatledger/outcome.hpp"

namespace seatledger {

ErrorCode error_code(const BookOutcome& outcome) {
    if (std::holds_alternative<OverbookingError>(outcome)) return ErrorCode::Overbooking;
    return ErrorCode::None;
}

ErrorCode error_code(const CancelOutcome& outcome) {
    if (std::holds_alternative<BookingNotFoundError>(outcome)) return ErrorCode::BookingNotFound;
    if (std::holds_alternative<SeatCountMismatchError>(outcome)) return ErrorCode::SeatCountMismatch;
    return ErrorCode::None;
}

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::Overbooking: return "overbooking";
        case ErrorCode::BookingNotFound: return "booking_not_found";
        case ErrorCode::SeatCountMismatch: return "seat_count_mismatch";
    }
    return "unknown";
}

std::string describe(const BookOutcome& outcome) {
    if (const auto* booked = std::get_if<SeatsBooked>(&outcome)) {
        return "Booked " + std::to_string(booked->seat_count()) + " seat(s) for " +
               booked->passenger() + ", " + std::to_string(booked->remaining_after()) +
               " remaining";
    }
    return "Not enough seats remaining";
}

std::string describe(const CancelOutcome& outcome) {
    if (const auto* cancelled = std::get_if<BookedSeatsCancelled>(&outcome)) {
        return "Cancelled " + std::to_string(cancelled->seat_count()) + " seat(s) for " +
               cancelled->passenger() + ", " + std::to_string(cancelled->remaining_after()) +
               " remaining";
    }
    if (const auto* mismatch = std::get_if<SeatCountMismatchError>(&outcome)) {
        return "Cannot cancel " + std::to_string(mismatch->requested_seats) +
               " seat(s), passenger holds " + std::to_string(mismatch->booked_seats);
    }
    return "No booking found for passenger";
}

} // namespace seatledger
