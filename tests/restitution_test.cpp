#include <gtest/gtest.h>
#include "locamat/errors.hpp"
#include "locamat/restitution.hpp"
#include "rental_fixture.hpp"

using namespace locamat;
using namespace locamat::test_support;

class RestitutionTest : public RentalTest {
protected:
    // Rent units for client 1 from 2024-01-08, due back 2024-01-10.
    IdList rent(const IdList& unit_ids) {
        auto reservation = reservations.reserve(1, unit_ids, day(2024, 1, 8), day(2024, 1, 10));
        return line_ids_of(reservation.contract.id());
    }
};

// =============================================================================
// Late Fees
// =============================================================================

TEST(LateFeeTest, LateDays_ShouldBeZeroWhenOnTimeOrEarly) {
    EXPECT_EQ(late_days(day(2024, 1, 10), day(2024, 1, 10)), 0);
    EXPECT_EQ(late_days(day(2024, 1, 10), day(2024, 1, 8)), 0);
    EXPECT_EQ(late_days(day(2024, 1, 10), day(2024, 1, 13)), 3);
    EXPECT_EQ(late_days(day(2024, 2, 28), day(2024, 3, 1)), 2);
}

TEST(LateFeeTest, PenaltyFor_ShouldBeExact) {
    EXPECT_EQ(penalty_for(3, helpers::make_money(500)).cents(), 1500);
    EXPECT_EQ(penalty_for(0, helpers::make_money(500)).cents(), 0);
    EXPECT_EQ(penalty_for(7, helpers::make_money(333)).cents(), 2331);
    EXPECT_THROW(penalty_for(-1, helpers::make_money(500)), InvalidArgumentError);
}

// =============================================================================
// Successful Returns
// =============================================================================

TEST_F(RestitutionTest, ThreeDaysLate_ShouldChargeFifteen) {
    auto line_ids = rent({1});

    auto lines = restitutions.restitute(line_ids, day(2024, 1, 13));

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(helpers::to_iso(lines[0].actual_return_date()), "2024-01-13");
    EXPECT_EQ(lines[0].late_days(), 3);
    EXPECT_EQ(lines[0].penalty().cents(), 1500);
    EXPECT_EQ(status_of(1), AVAILABLE);

    auto stored = store.find_line(line_ids[0]);
    EXPECT_EQ(stored->late_days(), 3);
    EXPECT_EQ(stored->penalty().cents(), 1500);
}

TEST_F(RestitutionTest, EarlyReturn_ShouldRecordZeroPenalty) {
    auto line_ids = rent({1});

    auto lines = restitutions.restitute(line_ids, day(2024, 1, 9));

    EXPECT_EQ(lines[0].late_days(), 0);
    ASSERT_TRUE(lines[0].has_penalty());
    EXPECT_EQ(lines[0].penalty().cents(), 0);
}

TEST_F(RestitutionTest, ConfiguredRate_ShouldDrivePenalty) {
    RestitutionCoordinator coordinator(store, helpers::parse_money("7.50"));
    auto line_ids = rent({1});

    auto lines = coordinator.restitute(line_ids, day(2024, 1, 13));
    EXPECT_EQ(lines[0].penalty().cents(), 2250);
}

TEST_F(RestitutionTest, DefaultRate_ShouldBeFivePerDay) {
    EXPECT_EQ(restitutions.penalty_rate_per_day().cents(), 500);
}

TEST_F(RestitutionTest, BatchOfLines_ShouldReleaseEveryUnit) {
    auto line_ids = rent({1, 2, 3});

    auto lines = restitutions.restitute(line_ids, day(2024, 1, 11));

    ASSERT_EQ(lines.size(), 3u);
    EXPECT_LT(lines[0].id(), lines[1].id());
    for (const auto& line : lines) EXPECT_EQ(line.penalty().cents(), 500);
    EXPECT_EQ(status_of(1), AVAILABLE);
    EXPECT_EQ(status_of(2), AVAILABLE);
    EXPECT_EQ(status_of(3), AVAILABLE);
}

TEST_F(RestitutionTest, PartialReturnOfContract_ShouldKeepOtherUnitsRented) {
    auto line_ids = rent({1, 2});

    restitutions.restitute({line_ids[0]}, day(2024, 1, 10));

    EXPECT_EQ(status_of(1), AVAILABLE);
    EXPECT_EQ(status_of(2), RENTED);
    EXPECT_FALSE(store.find_line(line_ids[1])->has_actual_return_date());
}

// =============================================================================
// Validation
// =============================================================================

TEST_F(RestitutionTest, EmptySelection_ShouldFailValidation) {
    try {
        restitutions.restitute({}, day(2024, 1, 10));
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_STREQ(e.what(), "no lines selected");
    }
}

TEST_F(RestitutionTest, MissingReturnDate_ShouldFailValidation) {
    auto line_ids = rent({1});
    try {
        restitutions.restitute(line_ids, std::nullopt);
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_STREQ(e.what(), "missing return date");
    }
    EXPECT_EQ(status_of(1), RENTED);
}

TEST_F(RestitutionTest, NegativeRate_ShouldBeRejectedAtConstruction) {
    EXPECT_THROW({ RestitutionCoordinator coordinator(store, helpers::make_money(-1)); },
                 InvalidArgumentError);
}

// =============================================================================
// Failures Leave The Batch Untouched
// =============================================================================

TEST_F(RestitutionTest, UnknownLine_ShouldListItAndReturnNothing) {
    auto line_ids = rent({1});
    try {
        restitutions.restitute({line_ids[0], 999}, day(2024, 1, 10));
        FAIL() << "expected NotFoundError";
    } catch (const NotFoundError& e) {
        EXPECT_EQ(e.resource(), "lines");
        EXPECT_EQ(e.ids(), (IdList{999}));
    }
    EXPECT_FALSE(store.find_line(line_ids[0])->has_actual_return_date());
    EXPECT_EQ(status_of(1), RENTED);
}

TEST_F(RestitutionTest, SecondReturn_ShouldConflictWithoutSideEffects) {
    auto line_ids = rent({1});
    restitutions.restitute(line_ids, day(2024, 1, 13));

    try {
        restitutions.restitute(line_ids, day(2024, 1, 20));
        FAIL() << "expected ConflictError";
    } catch (const ConflictError& e) {
        EXPECT_EQ(e.reason(), "already returned");
        EXPECT_EQ(e.ids(), line_ids);
    }

    auto stored = store.find_line(line_ids[0]);
    EXPECT_EQ(helpers::to_iso(stored->actual_return_date()), "2024-01-13");
    EXPECT_EQ(stored->late_days(), 3);
    EXPECT_EQ(stored->penalty().cents(), 1500);
    EXPECT_EQ(status_of(1), AVAILABLE);
}

TEST_F(RestitutionTest, BatchWithReturnedLine_ShouldLeaveOpenLinesUntouched) {
    auto first = rent({1});
    auto second = rent({2});
    restitutions.restitute(first, day(2024, 1, 10));

    try {
        restitutions.restitute({second[0], first[0]}, day(2024, 1, 12));
        FAIL() << "expected ConflictError";
    } catch (const ConflictError& e) {
        EXPECT_EQ(e.ids(), first);
    }

    EXPECT_FALSE(store.find_line(second[0])->has_actual_return_date());
    EXPECT_EQ(status_of(2), RENTED);
}
