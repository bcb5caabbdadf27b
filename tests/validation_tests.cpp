#include <gtest/gtest.h>

#include "lending/errors.hpp"
#include "lending/validation.hpp"
#include "test_orders.hpp"

using namespace lending;
using testutil::borrower;
using testutil::lender;

TEST(OrderValidation, WellFormedOrderPasses) {
    auto ord = lender(1, 10000, 500);
    ord.min_principal = Amount(5000);
    ord.max_principal = Amount(20000);
    ord.min_rate      = RateBps(400);
    ord.max_rate      = RateBps(600);
    EXPECT_NO_THROW(validate_order(ord));
}

TEST(OrderValidation, ZeroPrincipalRejected) {
    EXPECT_THROW(validate_order(lender(1, 0, 500)), InvalidInput);
}

TEST(OrderValidation, NegativePrincipalRejected) {
    EXPECT_THROW(validate_order(borrower(1, -10, 500)), InvalidInput);
}

TEST(OrderValidation, NegativeRateRejected) {
    EXPECT_THROW(validate_order(borrower(1, 10, -1)), InvalidInput);
}

TEST(OrderValidation, OversizedPrincipalOverflows) {
    auto ord = lender(1, 1, 500);
    ord.principal = max_amount() + 1;
    EXPECT_THROW(validate_order(ord), ArithmeticOverflow);

    ord.principal = max_amount();
    EXPECT_NO_THROW(validate_order(ord));
}

TEST(OrderValidation, OversizedRateOverflows) {
    auto ord = lender(1, 1, 500);
    ord.rate = max_rate() + 1;
    EXPECT_THROW(validate_order(ord), ArithmeticOverflow);
}

TEST(OrderValidation, ContradictoryBoundsRejected) {
    auto ord = lender(1, 100, 500);
    ord.min_principal = Amount(200);
    ord.max_principal = Amount(50);
    EXPECT_THROW(validate_order(ord), InvalidInput);

    auto rates = borrower(2, 100, 500);
    rates.min_rate = RateBps(600);
    rates.max_rate = RateBps(400);
    EXPECT_THROW(validate_order(rates), InvalidInput);
}

TEST(OrderValidation, TermsOutsideOwnBoundsRejected) {
    auto low = lender(1, 100, 500);
    low.min_principal = Amount(101);
    EXPECT_THROW(validate_order(low), InvalidInput);

    auto high_rate = borrower(2, 100, 700);
    high_rate.max_rate = RateBps(650);
    EXPECT_THROW(validate_order(high_rate), InvalidInput);
}

TEST(OrderValidation, DuplicateIdsRejected) {
    OrderList orders{lender(7, 100, 500), borrower(7, 100, 600)};
    EXPECT_THROW(validate_orders(orders), InvalidInput);
}

TEST(OrderValidation, InvalidInputIsMatchingError) {
    try {
        validate_order(lender(3, 0, 500));
        FAIL() << "expected InvalidInput";
    } catch (const MatchingError& e) {
        EXPECT_NE(std::string(e.what()).find("order 3"), std::string::npos);
    }
}
