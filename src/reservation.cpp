#include "locamat/reservation.hpp"

#include <limits>
#include "locamat/equipment_status.hpp"
#include "locamat/errors.hpp"
#include "locamat/helpers.hpp"
#include "locamat/logging.hpp"
#include "locamat/risk_classifier.hpp"
#include "locamat/validation.hpp"

namespace locamat {

namespace {
constexpr const char* kDomain = "reservation";
} // anonymous namespace

int32_t ReservationCoordinator::duration_days(const Date& start_date, const Date& end_date) {
    const int64_t days = helpers::days_between(start_date, end_date) + 1;
    if (days > std::numeric_limits<int32_t>::max()) {
        throw ValidationError("invalid date range");
    }
    return static_cast<int32_t>(days);
}

Reservation ReservationCoordinator::reserve(int64_t client_id, const IdList& unit_ids,
                                            const Date& start_date, const Date& end_date) {
    // Validate before any lock is taken.
    validation::require_not_empty(unit_ids, "no units selected");
    validation::require_valid_date(start_date, "start date");
    validation::require_valid_date(end_date, "end date");
    validation::require_date_order(start_date, end_date, "invalid date range");
    const int32_t duration = duration_days(start_date, end_date);
    if (duration < 1) {
        throw ValidationError("invalid date range");
    }

    Reservation reservation;
    auto uow = store_.begin();
    try {
        reservation = reserve_locked(*uow, client_id, unit_ids, start_date, end_date, duration);
        uow->commit();
    } catch (const RentalError& e) {
        uow->rollback();
        log_warn(kDomain, "reservation_rejected",
                 {{"client_id", client_id}, {"error", e.what()}, {"ids", e.ids()}});
        throw;
    } catch (const std::exception& e) {
        uow->rollback();
        log_error(kDomain, "reservation_failed", {{"client_id", client_id}, {"error", e.what()}});
        throw;
    }

    IdList rented;
    for (const auto& unit : reservation.units) rented.push_back(unit.id());
    log_info(kDomain, "reservation_committed",
             {{"contract_id", reservation.contract.id()},
              {"client_id", client_id},
              {"unit_ids", rented},
              {"duration_days", duration},
              {"total", helpers::format_money(reservation.price.total())}});
    return reservation;
}

Reservation ReservationCoordinator::reserve_locked(UnitOfWork& uow, int64_t client_id,
                                                   const IdList& unit_ids,
                                                   const Date& start_date, const Date& end_date,
                                                   int32_t duration) {
    auto client = uow.find_client(client_id);
    if (!client) {
        throw NotFoundError("client", {client_id});
    }

    const IdList requested = helpers::sorted_unique(unit_ids);
    std::vector<EquipmentUnit> units = uow.lock_units(requested);

    IdList found;
    for (const auto& unit : units) found.push_back(unit.id());
    IdList missing = helpers::missing_ids(requested, found);
    if (!missing.empty()) {
        throw NotFoundError("equipment", std::move(missing));
    }

    IdList unavailable;
    for (const auto& unit : units) {
        if (!equipment_status::is_rentable(unit.status())) unavailable.push_back(unit.id());
    }
    if (!unavailable.empty()) {
        throw ConflictError("equipment unavailable", std::move(unavailable));
    }

    int64_t base_cents = 0;
    for (const auto& unit : units) {
        const int64_t rate = unit.daily_rate().cents();
        if (rate < 0 || (rate > 0 && (std::numeric_limits<int64_t>::max() - base_cents) / rate < duration)) {
            throw StorageError("equipment " + std::to_string(unit.id()) + " has an unusable daily rate");
        }
        base_cents += rate * duration;
    }

    const bool risky = RiskClassifier::is_risky(uow, client_id);
    const bool vip = client->vip() == VIP_YES;

    Reservation reservation;
    reservation.price = price(helpers::make_money(base_cents), duration, vip, risky, policy_);

    Contract contract;
    contract.set_client_id(client_id);
    *contract.mutable_start_date() = start_date;
    *contract.mutable_end_date() = end_date;
    reservation.contract = uow.insert_contract(contract);

    for (auto& unit : units) {
        ContractLine line;
        line.set_contract_id(reservation.contract.id());
        line.set_unit_id(unit.id());
        *line.mutable_planned_return_date() = end_date;
        uow.insert_line(line);

        unit.set_status(equipment_status::on_reserve(unit));
        uow.update_unit(unit);
    }

    reservation.units = std::move(units);
    return reservation;
}

} // namespace locamat
