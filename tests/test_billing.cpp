#include "parking_ticket.h"
#include <gtest/gtest.h>

namespace {
constexpr time_t ENTRY = 1700000000;
constexpr time_t MINUTE = 60;
}

TEST(BillingTest, PartialHoursAreNotBilled) {
    EXPECT_DOUBLE_EQ(calculateFee(ENTRY, ENTRY + 59 * MINUTE, 10.0), 0.0);
    EXPECT_DOUBLE_EQ(calculateFee(ENTRY, ENTRY + 60 * MINUTE, 10.0), 10.0);
    EXPECT_DOUBLE_EQ(calculateFee(ENTRY, ENTRY + 119 * MINUTE, 10.0), 10.0);
    EXPECT_DOUBLE_EQ(calculateFee(ENTRY, ENTRY + 120 * MINUTE, 10.0), 20.0);
}

TEST(BillingTest, UsesGivenRate) {
    EXPECT_DOUBLE_EQ(calculateFee(ENTRY, ENTRY + 3 * 60 * MINUTE, 2.5), 7.5);
    EXPECT_DOUBLE_EQ(calculateFee(ENTRY, ENTRY + 3 * 60 * MINUTE, 0.0), 0.0);
}

TEST(BillingTest, ZeroOrNegativeDurationIsFree) {
    EXPECT_DOUBLE_EQ(calculateFee(ENTRY, ENTRY, 10.0), 0.0);
    EXPECT_DOUBLE_EQ(calculateFee(ENTRY, ENTRY - 5 * 60 * MINUTE, 10.0), 0.0);
}

TEST(ParkingTicketTest, CheckoutRecordsExitAndStatus) {
    ParkingTicket ticket("TKT_0", Vehicle(VehicleType::Compact, "Toyota", "ABC123"), "F1-spot_0", ENTRY);
    EXPECT_EQ(ticket.getPaymentStatus(), PaymentStatus::Pending);
    EXPECT_FALSE(ticket.hasExited());

    ticket.checkout(ENTRY + 90 * MINUTE, PaymentStatus::Succeeded);
    EXPECT_TRUE(ticket.hasExited());
    EXPECT_EQ(*ticket.getExitTime(), ENTRY + 90 * MINUTE);
    EXPECT_EQ(ticket.getPaymentStatus(), PaymentStatus::Succeeded);
}
