#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include "seatledger/flight_ledger.hpp"

namespace seatledger {

/**
 * Owns the ledgers of many flights and serializes access to each of them.
 *
 * Every operation on a flight runs under that flight's mutex; operations on
 * different flights do not contend beyond the short map lookup. Unknown ids
 * throw FlightNotFoundError.
 */
class FlightRegistry {
public:
    explicit FlightRegistry(LedgerOptions options = {});

    FlightRegistry(const FlightRegistry&) = delete;
    FlightRegistry& operator=(const FlightRegistry&) = delete;

    /// Open a flight with the registry's options. Returns its id.
    std::string create_flight(int32_t total_seats);

    /// Take ownership of an existing ledger, e.g. one rebuilt with replay().
    /// @throws InvalidArgumentError if a flight with the same id is registered.
    std::string adopt(FlightLedger ledger);

    BookOutcome book_seats(const std::string& flight_id, const std::string& passenger, int32_t seat_count);
    CancelOutcome cancel_booked_seats(const std::string& flight_id, const std::string& passenger,
                                      int32_t cancel_seat_count);

    int32_t remaining_seats(const std::string& flight_id) const;
    std::vector<Booking> bookings(const std::string& flight_id) const;
    EventBook history(const std::string& flight_id) const;

    /// Run a read-only callback against a flight while holding its lock.
    template<typename Fn>
    auto inspect(const std::string& flight_id, Fn&& fn) const
        -> decltype(fn(std::declval<const FlightLedger&>())) {
        auto entry = find(flight_id);
        std::lock_guard<std::mutex> lock(entry->mutex);
        return fn(static_cast<const FlightLedger&>(entry->ledger));
    }

    bool contains(const std::string& flight_id) const;
    size_t size() const;
    std::vector<std::string> flight_ids() const;

private:
    struct Entry {
        explicit Entry(FlightLedger l) : ledger(std::move(l)) {}

        std::mutex mutex;
        FlightLedger ledger;
    };

    std::shared_ptr<Entry> find(const std::string& flight_id) const;

    LedgerOptions options_;
    mutable std::mutex flights_mutex_;
    std::map<std::string, std::shared_ptr<Entry>> flights_;
};

} // namespace seatledger
