#pragma once

#include <cstdint>
#include <vector>
#include "locamat/types.pb.h"
#include "pricing.hpp"
#include "store.hpp"

namespace locamat {

struct Reservation {
    Contract contract;
    std::vector<EquipmentUnit> units;
    PriceBreakdown price;
};

/**
 * Rents out a set of equipment units to a client in one unit of work.
 *
 * The requested rows stay locked from the availability check until commit,
 * so two overlapping reservations serialize and the second one observes the
 * units as RENTED. Any failure rolls the whole reservation back.
 */
class ReservationCoordinator {
public:
    explicit ReservationCoordinator(Store& store, PricingPolicy policy = PricingPolicy{})
        : store_(store), policy_(policy) {}

    /**
     * @throws ValidationError if unit_ids is empty or the dates are invalid
     * @throws NotFoundError   for an unknown client or unknown unit ids
     * @throws ConflictError   if a unit is not available or a lock times out
     * @throws StorageError    on infrastructure failure
     */
    Reservation reserve(int64_t client_id, const IdList& unit_ids,
                        const Date& start_date, const Date& end_date);

    /**
     * Inclusive day count of a rental.
     */
    static int32_t duration_days(const Date& start_date, const Date& end_date);

    const PricingPolicy& policy() const { return policy_; }

private:
    Reservation reserve_locked(UnitOfWork& uow, int64_t client_id, const IdList& unit_ids,
                               const Date& start_date, const Date& end_date,
                               int32_t duration);

    Store& store_;
    PricingPolicy policy_;
};

} // namespace locamat
