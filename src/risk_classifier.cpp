#include "locamat/risk_classifier.hpp"
#include "locamat/helpers.hpp"

namespace locamat {

bool RiskClassifier::is_risky(int64_t client_id) const {
    auto uow = store_.begin();
    bool risky = is_risky(*uow, client_id);
    uow->commit();
    return risky;
}

bool RiskClassifier::is_risky(UnitOfWork& uow, int64_t client_id) {
    auto latest = uow.latest_contract(client_id);
    if (!latest) return false;

    for (const auto& line : latest->lines) {
        if (line.has_actual_return_date() &&
            helpers::is_before(line.planned_return_date(), line.actual_return_date())) {
            return true;
        }
    }
    return false;
}

} // namespace locamat
