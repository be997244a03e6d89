#pragma once

/**
 * seatledger - flight seat inventory library
 *
 * Main include file - includes all public headers.
 */

// Error types
#include "errors.hpp"

// Validation helpers
#include "validation.hpp"

// Helper utilities
#include "helpers.hpp"

// Structured logging
#include "logging.hpp"

// Domain types and results
#include "booking.hpp"
#include "ledger_options.hpp"
#include "outcome.hpp"

// Ledger and registry
#include "ledger_state.hpp"
#include "flight_ledger.hpp"
#include "flight_registry.hpp"
