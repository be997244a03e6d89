#include <gtest/gtest.h>
#include <string>
#include <variant>
#include "seatledger/errors.hpp"
#include "seatledger/flight_ledger.hpp"
#include "seatledger/helpers.hpp"
#include "seatledger/logging.hpp"

using namespace seatledger;

class FlightLedgerTest : public ::testing::Test {
protected:
    void SetUp() override { set_log_level(LogLevel::Error); }
};

// =============================================================================
// Creation
// =============================================================================

TEST_F(FlightLedgerTest, Create_ShouldStartWithAllSeatsRemaining) {
    for (int32_t total : {1, 3, 180}) {
        auto flight = FlightLedger::create(total);

        EXPECT_EQ(flight.total_seats(), total);
        EXPECT_EQ(flight.remaining_seats(), total);
        EXPECT_TRUE(flight.bookings().empty());
    }
}

TEST_F(FlightLedgerTest, Create_ShouldAssignDistinctIds) {
    auto first = FlightLedger::create(10);
    auto second = FlightLedger::create(10);

    EXPECT_EQ(first.id().size(), 32u);
    EXPECT_NE(first.id(), second.id());
}

TEST_F(FlightLedgerTest, Create_ShouldRecordFlightOpened) {
    auto flight = FlightLedger::create(10);

    const auto& history = flight.history();
    ASSERT_EQ(history.pages_size(), 1);
    EXPECT_EQ(history.cover().domain(), "flight");
    EXPECT_EQ(helpers::root_id_hex(history), flight.id());

    FlightOpened opened;
    ASSERT_TRUE(history.pages(0).event().UnpackTo(&opened));
    EXPECT_EQ(opened.flight_id(), flight.id());
    EXPECT_EQ(opened.total_seats(), 10);
}

TEST_F(FlightLedgerTest, Create_WithNonPositiveCapacity_ShouldThrow) {
    EXPECT_THROW(FlightLedger::create(0), InvalidArgumentError);
    EXPECT_THROW(FlightLedger::create(-4), InvalidArgumentError);
}

// =============================================================================
// Booking
// =============================================================================

TEST_F(FlightLedgerTest, BookSeats_TwoPassengers_ShouldReduceRemainingSeats) {
    auto flight = FlightLedger::create(4);

    flight.book_seats("Alice", 1);
    flight.book_seats("Bob", 1);

    EXPECT_EQ(flight.remaining_seats(), 2);
}

TEST_F(FlightLedgerTest, BookSeats_MoreThanAvailable_ShouldReturnOverbooking) {
    auto flight = FlightLedger::create(2);

    auto outcome = flight.book_seats("Alice", 4);

    EXPECT_TRUE(std::holds_alternative<OverbookingError>(outcome));
    EXPECT_EQ(flight.remaining_seats(), 2);
    EXPECT_TRUE(flight.bookings().empty());
    EXPECT_EQ(flight.history().pages_size(), 1);
}

TEST_F(FlightLedgerTest, BookSeats_WithinCapacity_ShouldSucceed) {
    auto flight = FlightLedger::create(4);

    auto outcome = flight.book_seats("Alice", 3);

    ASSERT_TRUE(succeeded(outcome));
    const auto& booked = std::get<SeatsBooked>(outcome);
    EXPECT_EQ(booked.passenger(), "Alice");
    EXPECT_EQ(booked.seat_count(), 3);
    EXPECT_EQ(booked.remaining_after(), 1);
}

TEST_F(FlightLedgerTest, BookSeats_ShouldRememberBooking) {
    auto flight = FlightLedger::create(10);

    flight.book_seats("Alice", 3);

    ASSERT_EQ(flight.bookings().size(), 1u);
    EXPECT_EQ(flight.bookings()[0], (Booking{"Alice", 3}));
}

TEST_F(FlightLedgerTest, BookSeats_ShouldAppendInOrderWithoutMerging) {
    auto flight = FlightLedger::create(10);

    flight.book_seats("Alice", 2);
    flight.book_seats("Bob", 1);
    flight.book_seats("Alice", 2);

    ASSERT_EQ(flight.bookings().size(), 3u);
    EXPECT_EQ(flight.bookings()[0], (Booking{"Alice", 2}));
    EXPECT_EQ(flight.bookings()[1], (Booking{"Bob", 1}));
    EXPECT_EQ(flight.bookings()[2], (Booking{"Alice", 2}));
    EXPECT_EQ(flight.booked_seats_for("Alice"), 4);
    EXPECT_EQ(flight.remaining_seats(), 5);
}

TEST_F(FlightLedgerTest, Bookings_ShouldBeUnaffectedByLaterChanges) {
    auto flight = FlightLedger::create(10);
    flight.book_seats("Alice", 2);

    auto snapshot = flight.bookings();
    flight.book_seats("Bob", 3);
    flight.cancel_booked_seats("Alice", 2);

    ASSERT_EQ(snapshot.size(), 1u);
    EXPECT_EQ(snapshot[0], (Booking{"Alice", 2}));
    ASSERT_EQ(flight.bookings().size(), 1u);
    EXPECT_EQ(flight.bookings()[0], (Booking{"Bob", 3}));
}

TEST_F(FlightLedgerTest, BookSeats_ExactlyRemaining_ShouldSellOut) {
    auto flight = FlightLedger::create(3);

    EXPECT_TRUE(succeeded(flight.book_seats("Alice", 3)));
    EXPECT_EQ(flight.remaining_seats(), 0);
    EXPECT_EQ(error_code(flight.book_seats("Bob", 1)), ErrorCode::Overbooking);
}

TEST_F(FlightLedgerTest, BookSeats_InvalidArguments_ShouldThrowWithoutMutation) {
    auto flight = FlightLedger::create(5);

    EXPECT_THROW(flight.book_seats("", 1), InvalidArgumentError);
    EXPECT_THROW(flight.book_seats("Alice", 0), InvalidArgumentError);
    EXPECT_THROW(flight.book_seats("Alice", -2), InvalidArgumentError);

    EXPECT_EQ(flight.remaining_seats(), 5);
    EXPECT_TRUE(flight.bookings().empty());
}

TEST_F(FlightLedgerTest, BookSeats_ShouldRecordEventWithNextSequence) {
    auto flight = FlightLedger::create(6);

    flight.book_seats("Alice", 2);

    const auto& history = flight.history();
    ASSERT_EQ(history.pages_size(), 2);
    EXPECT_EQ(history.pages(1).sequence(), 1u);
    EXPECT_EQ(helpers::type_name_from_url(history.pages(1).event().type_url()), "seatledger.SeatsBooked");
}

// =============================================================================
// Cancellation (default policy)
// =============================================================================

TEST_F(FlightLedgerTest, CancelBookedSeats_NoBooking_ShouldReturnBookingNotFound) {
    auto flight = FlightLedger::create(3);

    auto outcome = flight.cancel_booked_seats("Alice", 1);

    EXPECT_TRUE(std::holds_alternative<BookingNotFoundError>(outcome));
    EXPECT_EQ(flight.remaining_seats(), 3);
}

TEST_F(FlightLedgerTest, CancelBookedSeats_OtherPassengerOnly_ShouldReturnBookingNotFound) {
    auto flight = FlightLedger::create(5);
    flight.book_seats("Bob", 2);

    auto outcome = flight.cancel_booked_seats("Alice", 2);

    EXPECT_EQ(error_code(outcome), ErrorCode::BookingNotFound);
    EXPECT_EQ(flight.remaining_seats(), 3);
    EXPECT_EQ(flight.bookings().size(), 1u);
}

TEST_F(FlightLedgerTest, CancelBookedSeats_ExactMatch_ShouldRestoreSeatsAndRemoveBooking) {
    auto flight = FlightLedger::create(4);
    flight.book_seats("Alice", 2);

    auto outcome = flight.cancel_booked_seats("Alice", 2);

    EXPECT_TRUE(succeeded(outcome));
    EXPECT_EQ(flight.remaining_seats(), 4);
    EXPECT_TRUE(flight.bookings().empty());
}

TEST_F(FlightLedgerTest, CancelBookedSeats_PartialCount_ShouldRestoreSeatsAndKeepBooking) {
    auto flight = FlightLedger::create(10);
    flight.book_seats("Alice", 4);

    auto outcome = flight.cancel_booked_seats("Alice", 2);

    EXPECT_TRUE(succeeded(outcome));
    EXPECT_EQ(flight.remaining_seats(), 8);
    ASSERT_EQ(flight.bookings().size(), 1u);
    EXPECT_EQ(flight.bookings()[0], (Booking{"Alice", 4}));
}

TEST_F(FlightLedgerTest, CancelBookedSeats_ShouldReturnSuccessForSmallerCount) {
    auto flight = FlightLedger::create(3);
    flight.book_seats("Alice", 2);

    auto outcome = flight.cancel_booked_seats("Alice", 1);

    EXPECT_EQ(error_code(outcome), ErrorCode::None);
}

TEST_F(FlightLedgerTest, CancelBookedSeats_RoundTrip_ShouldRemoveExactlyOneEntry) {
    auto flight = FlightLedger::create(10);
    flight.book_seats("Alice", 3);
    flight.book_seats("Alice", 3);
    const int32_t before = flight.remaining_seats();

    flight.book_seats("Alice", 3);
    flight.cancel_booked_seats("Alice", 3);

    EXPECT_EQ(flight.remaining_seats(), before);
    EXPECT_EQ(flight.bookings().size(), 2u);
}

TEST_F(FlightLedgerTest, CancelBookedSeats_InvalidArguments_ShouldThrow) {
    auto flight = FlightLedger::create(5);
    flight.book_seats("Alice", 2);

    EXPECT_THROW(flight.cancel_booked_seats("", 1), InvalidArgumentError);
    EXPECT_THROW(flight.cancel_booked_seats("Alice", 0), InvalidArgumentError);
    EXPECT_EQ(flight.remaining_seats(), 3);
}

TEST_F(FlightLedgerTest, RemainingSeats_ShouldStayWithinCapacity) {
    auto flight = FlightLedger::create(5);
    flight.book_seats("Alice", 1);

    flight.cancel_booked_seats("Alice", 4);
    flight.cancel_booked_seats("Alice", 4);

    EXPECT_GE(flight.remaining_seats(), 0);
    EXPECT_LE(flight.remaining_seats(), flight.total_seats());
    EXPECT_EQ(flight.remaining_seats(), 5);
}
