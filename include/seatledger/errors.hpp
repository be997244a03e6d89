#pragma once

#include <stdexcept>
#include <string>

namespace seatledger {

/**
 * Base exception for seatledger contract violations.
 *
 * Domain outcomes such as overbooking are not exceptions; they are returned
 * as variants (see outcome.hpp).
 */
class LedgerError : public std::runtime_error {
public:
    explicit LedgerError(const std::string& message)
        : std::runtime_error(message) {}

    /**
     * Returns true if a caller passed an argument outside the contract.
     */
    virtual bool is_invalid_argument() const { return false; }

    /**
     * Returns true if a referenced flight does not exist.
     */
    virtual bool is_not_found() const { return false; }

    /**
     * Returns true if an event history could not be replayed.
     */
    virtual bool is_corrupt_history() const { return false; }
};

/**
 * Thrown when an invalid argument is provided.
 */
class InvalidArgumentError : public LedgerError {
public:
    explicit InvalidArgumentError(const std::string& message)
        : LedgerError(message) {}

    bool is_invalid_argument() const override { return true; }
};

/**
 * Thrown by FlightRegistry for an unknown flight id.
 */
class FlightNotFoundError : public LedgerError {
public:
    explicit FlightNotFoundError(const std::string& flight_id)
        : LedgerError("Flight not found: " + flight_id), flight_id_(flight_id) {}

    const std::string& flight_id() const { return flight_id_; }

    bool is_not_found() const override { return true; }

private:
    std::string flight_id_;
};

/**
 * Thrown when an EventBook cannot be replayed into a ledger.
 */
class InvalidEventError : public LedgerError {
public:
    InvalidEventError(const std::string& message, int sequence)
        : LedgerError(message + " (sequence " + std::to_string(sequence) + ")"),
          sequence_(sequence) {}

    int sequence() const { return sequence_; }

    bool is_corrupt_history() const override { return true; }

private:
    int sequence_;
};

} // namespace seatledger
