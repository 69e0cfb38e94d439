#include "locamat/restitution.hpp"

#include <limits>
#include "locamat/equipment_status.hpp"
#include "locamat/errors.hpp"
#include "locamat/helpers.hpp"
#include "locamat/logging.hpp"
#include "locamat/validation.hpp"

namespace locamat {

namespace {
constexpr const char* kDomain = "restitution";
} // anonymous namespace

int32_t late_days(const Date& planned_return_date, const Date& actual_return_date) {
    const int64_t days = helpers::days_between(planned_return_date, actual_return_date);
    if (days <= 0) return 0;
    if (days > std::numeric_limits<int32_t>::max()) {
        throw InvalidArgumentError("return date too far from planned date");
    }
    return static_cast<int32_t>(days);
}

Money penalty_for(int32_t late_days, const Money& rate_per_day) {
    validation::require_non_negative(late_days, "late days");
    validation::require_non_negative(rate_per_day.cents(), "penalty rate");
    if (late_days > 0 && rate_per_day.cents() > std::numeric_limits<int64_t>::max() / late_days) {
        throw InvalidArgumentError("penalty overflows");
    }
    return helpers::make_money(rate_per_day.cents() * late_days);
}

RestitutionCoordinator::RestitutionCoordinator(Store& store)
    : RestitutionCoordinator(store, helpers::make_money(kDefaultPenaltyPerDayCents)) {}

RestitutionCoordinator::RestitutionCoordinator(Store& store, const Money& penalty_rate_per_day)
    : store_(store), penalty_rate_per_day_(penalty_rate_per_day) {
    validation::require_non_negative(penalty_rate_per_day.cents(), "penalty rate");
}

std::vector<ContractLine> RestitutionCoordinator::restitute(
    const IdList& line_ids, const std::optional<Date>& actual_return_date) {
    validation::require_not_empty(line_ids, "no lines selected");
    validation::require_present(actual_return_date, "missing return date");
    validation::require_valid_date(*actual_return_date, "return date");

    std::vector<ContractLine> returned;
    auto uow = store_.begin();
    try {
        returned = restitute_locked(*uow, line_ids, *actual_return_date);
        uow->commit();
    } catch (const RentalError& e) {
        uow->rollback();
        log_warn(kDomain, "restitution_rejected", {{"error", e.what()}, {"ids", e.ids()}});
        throw;
    } catch (const std::exception& e) {
        uow->rollback();
        log_error(kDomain, "restitution_failed", {{"error", e.what()}});
        throw;
    }

    IdList ids;
    int64_t penalties = 0;
    for (const auto& line : returned) {
        ids.push_back(line.id());
        penalties += line.penalty().cents();
    }
    log_info(kDomain, "restitution_committed",
             {{"line_ids", ids},
              {"return_date", helpers::to_iso(*actual_return_date)},
              {"penalties", helpers::format_money(helpers::make_money(penalties))}});
    return returned;
}

std::vector<ContractLine> RestitutionCoordinator::restitute_locked(UnitOfWork& uow,
                                                                   const IdList& line_ids,
                                                                   const Date& actual_return_date) {
    const IdList requested = helpers::sorted_unique(line_ids);
    std::vector<ContractLine> lines = uow.lock_lines(requested);

    if (lines.size() != requested.size()) {
        IdList found;
        for (const auto& line : lines) found.push_back(line.id());
        throw NotFoundError("lines", helpers::missing_ids(requested, found));
    }

    IdList already_returned;
    IdList unit_ids;
    for (const auto& line : lines) {
        if (line.has_actual_return_date()) already_returned.push_back(line.id());
        unit_ids.push_back(line.unit_id());
    }
    if (!already_returned.empty()) {
        throw ConflictError("already returned", std::move(already_returned));
    }

    unit_ids = helpers::sorted_unique(std::move(unit_ids));
    std::vector<EquipmentUnit> units = uow.lock_units(unit_ids);
    if (units.size() != unit_ids.size()) {
        IdList found;
        for (const auto& unit : units) found.push_back(unit.id());
        throw StorageError("lines reference missing equipment: " +
                           helpers::join_ids(helpers::missing_ids(unit_ids, found)));
    }

    for (auto& line : lines) {
        const int32_t late = late_days(line.planned_return_date(), actual_return_date);
        *line.mutable_actual_return_date() = actual_return_date;
        line.set_late_days(late);
        *line.mutable_penalty() = penalty_for(late, penalty_rate_per_day_);
        uow.update_line(line);
    }

    for (auto& unit : units) {
        unit.set_status(equipment_status::on_return(unit));
        uow.update_unit(unit);
    }

    return lines;
}

} // namespace locamat
