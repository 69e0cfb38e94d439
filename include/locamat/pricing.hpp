#pragma once

#include <cstdint>
#include "locamat/types.pb.h"

namespace locamat {

/**
 * Discount and surcharge rates, in whole percents.
 */
struct PricingPolicy {
    int32_t long_rental_threshold_days = 7;
    int32_t duration_discount_percent = 10;
    int32_t vip_discount_percent = 15;
    int32_t risk_surcharge_percent = 5;
};

/**
 * Price a rental.
 *
 * total = base × (1 − duration discount) × (1 − VIP discount) × (1 + risk surcharge),
 * applied in that order and rounded half-up to the cent. The duration discount
 * applies to rentals strictly longer than the policy threshold.
 *
 * @param base_total    sum of daily rate × duration over the rented units
 * @param duration_days inclusive day count of the rental
 * @throws InvalidArgumentError on a negative base, non-positive duration,
 *         rates outside [0, 100] or an amount too large to price exactly
 */
PriceBreakdown price(const Money& base_total, int32_t duration_days, bool client_vip,
                     bool client_risk, const PricingPolicy& policy = PricingPolicy{});

} // namespace locamat
