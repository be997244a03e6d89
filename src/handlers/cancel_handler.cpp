#include "cancel_handler.hpp"
#include "seatledger/validation.hpp"
#include <algorithm>

namespace seatledger {
namespace handlers {

namespace {

/// Index of the first booking equal to (passenger, seats), or -1.
int find_exact(const LedgerState& state, const std::string& passenger, int32_t seats) {
    const Booking wanted{passenger, seats};
    auto it = std::find(state.bookings.begin(), state.bookings.end(), wanted);
    return it == state.bookings.end() ? -1 : static_cast<int>(it - state.bookings.begin());
}

void add_release(BookedSeatsCancelled& event, int index, int32_t seats) {
    auto* release = event.add_releases();
    release->set_booking_index(static_cast<uint32_t>(index));
    release->set_seats(seats);
}

} // anonymous namespace

CancelOutcome handle_cancel(const LedgerState& state, const std::string& passenger,
                            int32_t cancel_seat_count, CancellationPolicy policy) {
    // Validate
    validation::require_not_empty(passenger, "passenger");
    validation::require_positive(cancel_seat_count, "cancel_seat_count");

    // Guard
    if (!state.has_booking_for(passenger)) {
        return BookingNotFoundError{};
    }

    BookedSeatsCancelled event;
    event.set_passenger(passenger);
    event.set_seat_count(cancel_seat_count);

    switch (policy) {
        case CancellationPolicy::Lenient: {
            int index = find_exact(state, passenger, cancel_seat_count);
            if (index >= 0) {
                add_release(event, index, cancel_seat_count);
            }
            // Seats are restored even without an exact match.
            event.set_remaining_after(state.remaining_after_release(cancel_seat_count));
            break;
        }
        case CancellationPolicy::ExactMatch: {
            int index = find_exact(state, passenger, cancel_seat_count);
            if (index < 0) {
                return SeatCountMismatchError{state.booked_seats_for(passenger), cancel_seat_count};
            }
            add_release(event, index, cancel_seat_count);
            event.set_remaining_after(state.remaining_after_release(cancel_seat_count));
            break;
        }
        case CancellationPolicy::Pooled: {
            int32_t pool = state.booked_seats_for(passenger);
            if (cancel_seat_count > pool) {
                return SeatCountMismatchError{pool, cancel_seat_count};
            }
            int32_t left = cancel_seat_count;
            for (int i = static_cast<int>(state.bookings.size()) - 1; i >= 0 && left > 0; --i) {
                const auto& booking = state.bookings[static_cast<size_t>(i)];
                if (booking.passenger != passenger) continue;
                int32_t taken = std::min(left, booking.seat_count);
                add_release(event, i, taken);
                left -= taken;
            }
            event.set_remaining_after(state.remaining_after_release(cancel_seat_count));
            break;
        }
    }

    return event;
}

} // namespace handlers
} // namespace seatledger
