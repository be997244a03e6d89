#include "book_handler.hpp"
#include "seatledger/validation.hpp"

namespace seatledger {
namespace handlers {

BookOutcome handle_book(const LedgerState& state, const std::string& passenger, int32_t seat_count) {
    // Validate
    validation::require_not_empty(passenger, "passenger");
    validation::require_positive(seat_count, "seat_count");

    // Guard
    if (seat_count > state.remaining_seats) {
        return OverbookingError{};
    }

    // Compute
    SeatsBooked event;
    event.set_passenger(passenger);
    event.set_seat_count(seat_count);
    event.set_remaining_after(state.remaining_seats - seat_count);
    return event;
}

} // namespace handlers
} // namespace seatledger
