#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "seatledger/booking.hpp"
#include "seatledger/ledger.pb.h"
#include "seatledger/ledger_options.hpp"
#include "seatledger/ledger_state.hpp"
#include "seatledger/outcome.hpp"

namespace seatledger {

/**
 * Seat inventory and booking history of one flight.
 *
 * Keeps 0 <= remaining_seats() <= total_seats(). Every accepted booking or
 * cancellation is recorded in history() and applied to the state, so a
 * ledger can be rebuilt with replay(). Not synchronized; see FlightRegistry
 * for concurrent use.
 */
class FlightLedger {
public:
    static constexpr const char* FLIGHT_DOMAIN = "flight";

    /**
     * Open a new flight with a fixed capacity.
     * @throws InvalidArgumentError if total_seats is not positive.
     */
    static FlightLedger create(int32_t total_seats, LedgerOptions options = {});

    /**
     * Rebuild a ledger from a previously recorded history.
     * @throws InvalidEventError if the history is empty or inconsistent, or
     * its cover root differs from the opened flight id.
     */
    static FlightLedger replay(const EventBook& history, LedgerOptions options = {});

    /**
     * Reserve seats for a passenger. Returns OverbookingError without
     * changing anything when fewer than seat_count seats remain.
     * @throws InvalidArgumentError for an empty passenger or non-positive seat_count.
     */
    BookOutcome book_seats(const std::string& passenger, int32_t seat_count);

    /**
     * Give back seats booked by a passenger, following the configured
     * CancellationPolicy. Returns BookingNotFoundError without changing
     * anything when the passenger holds no booking.
     * @throws InvalidArgumentError for an empty passenger or non-positive seat count.
     */
    CancelOutcome cancel_booked_seats(const std::string& passenger, int32_t cancel_seat_count);

    const std::string& id() const { return state_.flight_id; }
    int32_t total_seats() const { return state_.total_seats; }
    int32_t remaining_seats() const { return state_.remaining_seats; }

    /// Snapshot of the bookings in the order they were made.
    std::vector<Booking> bookings() const { return state_.bookings; }

    int32_t booked_seats_for(const std::string& passenger) const {
        return state_.booked_seats_for(passenger);
    }

    const EventBook& history() const { return history_; }
    const LedgerOptions& options() const { return options_; }

private:
    explicit FlightLedger(LedgerOptions options);

    template<typename Event>
    void record(const Event& event);

    LedgerState state_;
    EventBook history_;
    LedgerOptions options_;
};

} // namespace seatledger
