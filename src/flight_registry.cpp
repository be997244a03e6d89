#include "seatledger/flight_registry.hpp"
#include "seatledger/errors.hpp"
#include "seatledger/logging.hpp"

namespace seatledger {

namespace {
constexpr const char* REGISTRY_DOMAIN = "flight_registry";
} // anonymous namespace

FlightRegistry::FlightRegistry(LedgerOptions options)
    : options_(options) {}

std::string FlightRegistry::create_flight(int32_t total_seats) {
    return adopt(FlightLedger::create(total_seats, options_));
}

std::string FlightRegistry::adopt(FlightLedger ledger) {
    std::string flight_id = ledger.id();
    int32_t total_seats = ledger.total_seats();
    {
        std::lock_guard<std::mutex> lock(flights_mutex_);
        if (flights_.count(flight_id) > 0) {
            throw InvalidArgumentError("Flight already registered: " + flight_id);
        }
        flights_.emplace(flight_id, std::make_shared<Entry>(std::move(ledger)));
    }

    log_info(REGISTRY_DOMAIN, "flight_registered",
        {{"flight_id", flight_id}, {"total_seats", total_seats}});
    return flight_id;
}

BookOutcome FlightRegistry::book_seats(const std::string& flight_id, const std::string& passenger,
                                       int32_t seat_count) {
    auto entry = find(flight_id);
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->ledger.book_seats(passenger, seat_count);
}

CancelOutcome FlightRegistry::cancel_booked_seats(const std::string& flight_id, const std::string& passenger,
                                                  int32_t cancel_seat_count) {
    auto entry = find(flight_id);
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->ledger.cancel_booked_seats(passenger, cancel_seat_count);
}

int32_t FlightRegistry::remaining_seats(const std::string& flight_id) const {
    return inspect(flight_id, [](const FlightLedger& ledger) { return ledger.remaining_seats(); });
}

std::vector<Booking> FlightRegistry::bookings(const std::string& flight_id) const {
    return inspect(flight_id, [](const FlightLedger& ledger) { return ledger.bookings(); });
}

EventBook FlightRegistry::history(const std::string& flight_id) const {
    return inspect(flight_id, [](const FlightLedger& ledger) { return ledger.history(); });
}

bool FlightRegistry::contains(const std::string& flight_id) const {
    std::lock_guard<std::mutex> lock(flights_mutex_);
    return flights_.count(flight_id) > 0;
}

size_t FlightRegistry::size() const {
    std::lock_guard<std::mutex> lock(flights_mutex_);
    return flights_.size();
}

std::vector<std::string> FlightRegistry::flight_ids() const {
    std::lock_guard<std::mutex> lock(flights_mutex_);
    std::vector<std::string> ids;
    ids.reserve(flights_.size());
    for (const auto& [flight_id, _] : flights_) {
        ids.push_back(flight_id);
    }
    return ids;
}

std::shared_ptr<FlightRegistry::Entry> FlightRegistry::find(const std::string& flight_id) const {
    std::lock_guard<std::mutex> lock(flights_mutex_);
    auto it = flights_.find(flight_id);
    if (it == flights_.end()) {
        throw FlightNotFoundError(flight_id);
    }
    return it->second;
}

} // namespace seatledger
