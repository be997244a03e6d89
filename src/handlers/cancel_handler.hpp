#pragma once

#include <string>
#include "seatledger/ledger_options.hpp"
#include "seatledger/ledger_state.hpp"
#include "seatledger/outcome.hpp"

namespace seatledger {
namespace handlers {

/// Decide a CancelBookedSeats request against the current state.
CancelOutcome handle_cancel(const LedgerState& state, const std::string& passenger,
                            int32_t cancel_seat_count, CancellationPolicy policy);

} // namespace handlers
} // namespace seatledger
