#include <gtest/gtest.h>
#include "locamat/errors.hpp"
#include "locamat/helpers.hpp"
#include "locamat/pricing.hpp"

using namespace locamat;
using helpers::make_money;

TEST(PricingTest, ShortRental_WithRegularClient_ShouldChargeBaseTotal) {
    // Given 3 units at 100.00/day for 3 days
    auto breakdown = price(make_money(90000), 3, false, false);

    // Then nothing is discounted
    EXPECT_EQ(breakdown.base_total().cents(), 90000);
    EXPECT_DOUBLE_EQ(breakdown.duration_discount(), 0.0);
    EXPECT_DOUBLE_EQ(breakdown.vip_discount(), 0.0);
    EXPECT_DOUBLE_EQ(breakdown.risk_surcharge(), 0.0);
    EXPECT_EQ(breakdown.total().cents(), 90000);
}

TEST(PricingTest, LongRental_WithVipClient_ShouldCompoundBothDiscounts) {
    // Given 1 unit at 50.00/day for 10 days, VIP client
    auto breakdown = price(make_money(50000), 10, true, false);

    // Then 500 × 0.90 × 0.85 = 382.50
    EXPECT_DOUBLE_EQ(breakdown.duration_discount(), 0.10);
    EXPECT_DOUBLE_EQ(breakdown.vip_discount(), 0.15);
    EXPECT_EQ(breakdown.total().cents(), 38250);
}

TEST(PricingTest, Discounts_ShouldBeMultiplicativeNotAdditive) {
    // 100.00 × 0.90 × 0.85 = 76.50; an additive 25% would give 75.00
    auto breakdown = price(make_money(10000), 8, true, false);
    EXPECT_EQ(breakdown.total().cents(), 7650);
}

TEST(PricingTest, RiskyClient_ShouldPaySurcharge) {
    auto breakdown = price(make_money(10000), 2, false, true);
    EXPECT_DOUBLE_EQ(breakdown.risk_surcharge(), 0.05);
    EXPECT_EQ(breakdown.total().cents(), 10500);
}

TEST(PricingTest, AllRules_ShouldApplyInOrder) {
    // 1000.00 × 0.90 × 0.85 × 1.05 = 803.25
    auto breakdown = price(make_money(100000), 8, true, true);
    EXPECT_EQ(breakdown.total().cents(), 80325);
}

TEST(PricingTest, DurationDiscount_ShouldStartAfterSevenDays) {
    EXPECT_DOUBLE_EQ(price(make_money(70000), 7, false, false).duration_discount(), 0.0);
    EXPECT_EQ(price(make_money(70000), 7, false, false).total().cents(), 70000);
    EXPECT_DOUBLE_EQ(price(make_money(80000), 8, false, false).duration_discount(), 0.10);
    EXPECT_EQ(price(make_money(80000), 8, false, false).total().cents(), 72000);
}

TEST(PricingTest, Total_ShouldRoundHalfUpToTheCent) {
    // 0.10 × 1.05 = 0.105 -> 0.11
    EXPECT_EQ(price(make_money(10), 1, false, true).total().cents(), 11);
    // 0.10 × 0.90 × 0.85 = 0.0765 -> 0.08
    EXPECT_EQ(price(make_money(10), 8, true, false).total().cents(), 8);
    // 0.01 × 0.85 = 0.0085 -> 0.01
    EXPECT_EQ(price(make_money(1), 1, true, false).total().cents(), 1);
}

TEST(PricingTest, ZeroBase_ShouldPriceToZero) {
    EXPECT_EQ(price(make_money(0), 10, true, true).total().cents(), 0);
}

TEST(PricingTest, CustomPolicy_ShouldOverrideRates) {
    PricingPolicy policy;
    policy.long_rental_threshold_days = 3;
    policy.duration_discount_percent = 20;

    auto breakdown = price(make_money(10000), 4, false, false, policy);
    EXPECT_DOUBLE_EQ(breakdown.duration_discount(), 0.20);
    EXPECT_EQ(breakdown.total().cents(), 8000);
}

TEST(PricingTest, InvalidArguments_ShouldThrow) {
    EXPECT_THROW(price(make_money(-1), 1, false, false), InvalidArgumentError);
    EXPECT_THROW(price(make_money(100), 0, false, false), InvalidArgumentError);

    PricingPolicy policy;
    policy.vip_discount_percent = 120;
    EXPECT_THROW(price(make_money(100), 1, true, false, policy), InvalidArgumentError);
}

TEST(PricingTest, HugeBase_ShouldRefuseToOverflow) {
    EXPECT_THROW(price(make_money(INT64_MAX / 2), 1, false, true), InvalidArgumentError);
}
