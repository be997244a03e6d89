#include "seatledger/ledger_state.hpp"
#include "seatledger/errors.hpp"
#include "seatledger/helpers.hpp"
#include <algorithm>
#include <cstddef>

namespace seatledger {

namespace {

void apply_opened(LedgerState& state, const FlightOpened& event, int sequence) {
    if (state.exists()) {
        throw InvalidEventError("Flight already opened", sequence);
    }
    if (event.flight_id().empty() || event.total_seats() <= 0) {
        throw InvalidEventError("FlightOpened needs an id and a positive capacity", sequence);
    }
    state.flight_id = event.flight_id();
    state.total_seats = event.total_seats();
    state.remaining_seats = event.total_seats();
    state.bookings.clear();
}

void apply_booked(LedgerState& state, const SeatsBooked& event, int sequence) {
    if (event.passenger().empty() || event.seat_count() <= 0) {
        throw InvalidEventError("SeatsBooked needs a passenger and a positive seat count", sequence);
    }
    if (event.seat_count() > state.remaining_seats ||
        event.remaining_after() != state.remaining_seats - event.seat_count()) {
        throw InvalidEventError("SeatsBooked does not match remaining seats", sequence);
    }
    state.bookings.push_back({event.passenger(), event.seat_count()});
    state.remaining_seats = event.remaining_after();
}

void apply_cancelled(LedgerState& state, const BookedSeatsCancelled& event, int sequence) {
    if (event.seat_count() <= 0) {
        throw InvalidEventError("BookedSeatsCancelled needs a positive seat count", sequence);
    }
    if (!state.has_booking_for(event.passenger())) {
        throw InvalidEventError("BookedSeatsCancelled for a passenger without bookings", sequence);
    }
    if (event.remaining_after() != state.remaining_after_release(event.seat_count())) {
        throw InvalidEventError("BookedSeatsCancelled does not match remaining seats", sequence);
    }

    int64_t released = 0;
    for (const auto& release : event.releases()) {
        released += release.seats();
    }
    if (released > event.seat_count()) {
        throw InvalidEventError("Seat releases exceed cancelled seat count", sequence);
    }

    // Releases are listed by descending index so erasing keeps later indices valid.
    size_t previous_index = state.bookings.size();
    for (const auto& release : event.releases()) {
        size_t index = release.booking_index();
        if (index >= previous_index) {
            throw InvalidEventError("Seat releases out of order", sequence);
        }
        auto& booking = state.bookings[index];
        if (booking.passenger != event.passenger() ||
            release.seats() <= 0 || release.seats() > booking.seat_count) {
            throw InvalidEventError("Seat release does not match booking", sequence);
        }
        booking.seat_count -= release.seats();
        if (booking.seat_count == 0) {
            state.bookings.erase(state.bookings.begin() + static_cast<std::ptrdiff_t>(index));
        }
        previous_index = index;
    }
    state.remaining_seats = event.remaining_after();
}

} // anonymous namespace

bool LedgerState::has_booking_for(const std::string& passenger) const {
    return std::any_of(bookings.begin(), bookings.end(),
        [&](const Booking& b) { return b.passenger == passenger; });
}

int32_t LedgerState::booked_seats_for(const std::string& passenger) const {
    int32_t total = 0;
    for (const auto& booking : bookings) {
        if (booking.passenger == passenger) total += booking.seat_count;
    }
    return total;
}

LedgerState LedgerState::from_event_book(const EventBook& event_book) {
    LedgerState state;
    int expected = 0;
    for (const auto& page : event_book.pages()) {
        if (static_cast<int>(page.sequence()) != expected) {
            throw InvalidEventError("Unexpected sequence number", static_cast<int>(page.sequence()));
        }
        apply_event(state, page.event(), expected);
        ++expected;
    }
    return state;
}

void LedgerState::apply_event(LedgerState& state, const google::protobuf::Any& event_any, int sequence) {
    const std::string& type_url = event_any.type_url();

    if (helpers::type_url_matches(type_url, FlightOpened::descriptor()->full_name())) {
        FlightOpened event;
        if (!event_any.UnpackTo(&event)) {
            throw InvalidEventError("Malformed FlightOpened", sequence);
        }
        apply_opened(state, event, sequence);
        return;
    }

    if (!state.exists()) {
        throw InvalidEventError("History must start with FlightOpened", sequence);
    }

    if (helpers::type_url_matches(type_url, SeatsBooked::descriptor()->full_name())) {
        SeatsBooked event;
        if (!event_any.UnpackTo(&event)) {
            throw InvalidEventError("Malformed SeatsBooked", sequence);
        }
        apply_booked(state, event, sequence);
    } else if (helpers::type_url_matches(type_url, BookedSeatsCancelled::descriptor()->full_name())) {
        BookedSeatsCancelled event;
        if (!event_any.UnpackTo(&event)) {
            throw InvalidEventError("Malformed BookedSeatsCancelled", sequence);
        }
        apply_cancelled(state, event, sequence);
    } else {
        throw InvalidEventError("Unknown event type: " + helpers::type_name_from_url(type_url), sequence);
    }
}

} // namespace seatledger
