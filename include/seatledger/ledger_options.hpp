#pragma once

#include <string>

namespace seatledger {

/// How CancelBookedSeats treats a seat count that differs from the booking.
enum class CancellationPolicy {
    /// Remove an exact (passenger, seats) match if present, restore the
    /// requested seats regardless, capped at the flight capacity.
    Lenient,
    /// Reject unless one booking matches passenger and seat count exactly.
    ExactMatch,
    /// Trim seats across the passenger's bookings, most recent first.
    Pooled,
};

const char* to_string(CancellationPolicy policy);

/// Accepts "lenient", "exact" and "pooled". Throws InvalidArgumentError otherwise.
CancellationPolicy parse_cancellation_policy(const std::string& name);

struct LedgerOptions {
    CancellationPolicy cancellation_policy = CancellationPolicy::Lenient;

    /// Reads SEATLEDGER_CANCELLATION_POLICY; unset keeps the defaults.
    static LedgerOptions from_env();
};

} // namespace seatledger
