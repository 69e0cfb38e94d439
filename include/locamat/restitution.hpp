#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include "locamat/types.pb.h"
#include "store.hpp"

namespace locamat {

/**
 * Days between the planned and actual return, zero if on time or early.
 */
int32_t late_days(const Date& planned_return_date, const Date& actual_return_date);

/**
 * late_days × rate, in exact cents.
 * @throws InvalidArgumentError on negative input or overflow
 */
Money penalty_for(int32_t late_days, const Money& rate_per_day);

/**
 * Records the return of contract lines in one unit of work: sets the actual
 * return date, late days and penalty of every line, and releases the units.
 * A batch is returned entirely or not at all.
 */
class RestitutionCoordinator {
public:
    static constexpr int64_t kDefaultPenaltyPerDayCents = 500;

    explicit RestitutionCoordinator(Store& store);
    RestitutionCoordinator(Store& store, const Money& penalty_rate_per_day);

    /**
     * @return the updated lines, ascending id
     * @throws ValidationError if line_ids is empty or the date is missing or invalid
     * @throws NotFoundError   listing unknown line ids
     * @throws ConflictError   listing lines already returned, or on lock timeout
     * @throws StorageError    on infrastructure failure
     */
    std::vector<ContractLine> restitute(const IdList& line_ids,
                                        const std::optional<Date>& actual_return_date);

    const Money& penalty_rate_per_day() const { return penalty_rate_per_day_; }

private:
    std::vector<ContractLine> restitute_locked(UnitOfWork& uow, const IdList& line_ids,
                                               const Date& actual_return_date);

    Store& store_;
    Money penalty_rate_per_day_;
};

} // namespace locamat
