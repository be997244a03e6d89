#pragma once

#include <string>
#include "seatledger/ledger_state.hpp"
#include "seatledger/outcome.hpp"

namespace seatledger {
namespace handlers {

/// Decide a BookSeats request against the current state.
BookOutcome handle_book(const LedgerState& state, const std::string& passenger, int32_t seat_count);

} // namespace handlers
} // namespace seatledger
