#include "locamat/pricing.hpp"

#include <limits>
#include "locamat/errors.hpp"
#include "locamat/helpers.hpp"
#include "locamat/validation.hpp"

namespace locamat {

namespace {

constexpr int64_t kPercentCubed = 100 * 100 * 100;

void require_percent(int32_t value, const std::string& field_name) {
    if (value < 0 || value > 100) {
        throw InvalidArgumentError(field_name + " must be within [0, 100]");
    }
}

} // anonymous namespace

PriceBreakdown price(const Money& base_total, int32_t duration_days, bool client_vip,
                     bool client_risk, const PricingPolicy& policy) {
    validation::require_non_negative(base_total.cents(), "base total");
    validation::require_positive(duration_days, "duration");
    require_percent(policy.duration_discount_percent, "duration discount");
    require_percent(policy.vip_discount_percent, "VIP discount");
    require_percent(policy.risk_surcharge_percent, "risk surcharge");

    const int64_t duration_discount =
        duration_days > policy.long_rental_threshold_days ? policy.duration_discount_percent : 0;
    const int64_t vip_discount = client_vip ? policy.vip_discount_percent : 0;
    const int64_t risk_surcharge = client_risk ? policy.risk_surcharge_percent : 0;

    // Exact fixed point: cents × three percent factors, scaled back by 100^3.
    const int64_t factor = (100 - duration_discount) * (100 - vip_discount) * (100 + risk_surcharge);
    const int64_t base = base_total.cents();
    if (factor > 0 &&
        base > (std::numeric_limits<int64_t>::max() - kPercentCubed / 2) / factor) {
        throw InvalidArgumentError("base total too large to price");
    }
    const int64_t total = (base * factor + kPercentCubed / 2) / kPercentCubed;

    PriceBreakdown breakdown;
    *breakdown.mutable_base_total() = base_total;
    breakdown.set_duration_discount(static_cast<double>(duration_discount) / 100.0);
    breakdown.set_vip_discount(static_cast<double>(vip_discount) / 100.0);
    breakdown.set_risk_surcharge(static_cast<double>(risk_surcharge) / 100.0);
    *breakdown.mutable_total() = helpers::make_money(total);
    return breakdown;
}

} // namespace locamat
