#include "seatledger/flight_ledger.hpp"
#include "seatledger/errors.hpp"
#include "seatledger/helpers.hpp"
#include "seatledger/logging.hpp"
#include "seatledger/validation.hpp"
#include "handlers/book_handler.hpp"
#include "handlers/cancel_handler.hpp"
#include <utility>

namespace seatledger {

FlightLedger::FlightLedger(LedgerOptions options)
    : options_(options) {}

template<typename Event>
void FlightLedger::record(const Event& event) {
    int sequence = helpers::next_sequence(&history_);
    EventPage page = helpers::pack_event(event, sequence);
    LedgerState::apply_event(state_, page.event(), sequence);
    *history_.add_pages() = std::move(page);
}

FlightLedger FlightLedger::create(int32_t total_seats, LedgerOptions options) {
    validation::require_positive(total_seats, "total_seats");

    FlightLedger ledger(options);
    auto* cover = ledger.history_.mutable_cover();
    cover->set_domain(FLIGHT_DOMAIN);
    *cover->mutable_root() = helpers::random_uuid();

    FlightOpened opened;
    opened.set_flight_id(helpers::root_id_hex(ledger.history_));
    opened.set_total_seats(total_seats);
    ledger.record(opened);

    log_info(FLIGHT_DOMAIN, "flight_opened",
        {{"flight_id", ledger.id()},
         {"total_seats", total_seats},
         {"cancellation_policy", to_string(options.cancellation_policy)}});
    return ledger;
}

FlightLedger FlightLedger::replay(const EventBook& history, LedgerOptions options) {
    FlightLedger ledger(options);
    ledger.state_ = LedgerState::from_event_book(history);
    if (!ledger.state_.exists()) {
        throw InvalidEventError("Empty history", 0);
    }
    if (!history.has_cover() || history.cover().domain() != FLIGHT_DOMAIN) {
        throw InvalidEventError("History cover is not a flight", 0);
    }
    if (helpers::root_id_hex(history) != ledger.state_.flight_id) {
        throw InvalidEventError("History root does not match flight id", 0);
    }
    ledger.history_ = history;
    return ledger;
}

BookOutcome FlightLedger::book_seats(const std::string& passenger, int32_t seat_count) {
    auto outcome = handlers::handle_book(state_, passenger, seat_count);

    if (const auto* booked = std::get_if<SeatsBooked>(&outcome)) {
        record(*booked);
        log_debug(FLIGHT_DOMAIN, "seats_booked",
            {{"flight_id", id()}, {"passenger", passenger},
             {"seats", seat_count}, {"remaining", remaining_seats()}});
    } else {
        log_warn(FLIGHT_DOMAIN, "overbooking_rejected",
            {{"flight_id", id()}, {"passenger", passenger},
             {"seats", seat_count}, {"remaining", remaining_seats()}});
    }
    return outcome;
}

CancelOutcome FlightLedger::cancel_booked_seats(const std::string& passenger, int32_t cancel_seat_count) {
    auto outcome = handlers::handle_cancel(
        state_, passenger, cancel_seat_count, options_.cancellation_policy);

    if (const auto* cancelled = std::get_if<BookedSeatsCancelled>(&outcome)) {
        record(*cancelled);
        log_debug(FLIGHT_DOMAIN, "seats_cancelled",
            {{"flight_id", id()}, {"passenger", passenger},
             {"seats", cancel_seat_count},
             {"bookings_touched", cancelled->releases_size()},
             {"remaining", remaining_seats()}});
    } else {
        log_warn(FLIGHT_DOMAIN, to_string(error_code(outcome)),
            {{"flight_id", id()}, {"passenger", passenger},
             {"seats", cancel_seat_count},
             {"policy", to_string(options_.cancellation_policy)}});
    }
    return outcome;
}

} // namespace seatledger
