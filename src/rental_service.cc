#include "locamat/rental_service.hpp"

#include <optional>
#include "locamat/contract_status.hpp"
#include "locamat/errors.hpp"
#include "locamat/helpers.hpp"
#include "locamat/logging.hpp"
#include <grpcpp/grpcpp.h>

namespace locamat {

class RentalServiceImpl final : public RentalService::Service {
public:
    RentalServiceImpl(Store& store, ReservationCoordinator& reservations,
                      RestitutionCoordinator& restitutions)
        : store_(store), reservations_(reservations), restitutions_(restitutions) {}

    grpc::Status Reserve(grpc::ServerContext* context,
                         const ReserveRequest* request,
                         ReserveResponse* response) override {
        try {
            IdList unit_ids(request->unit_ids().begin(), request->unit_ids().end());
            auto reservation = reservations_.reserve(request->client_id(), unit_ids,
                                                     request->start_date(), request->end_date());

            *response->mutable_contract() = reservation.contract;
            for (const auto& unit : reservation.units) *response->add_units() = unit;
            *response->mutable_price() = reservation.price;
            return grpc::Status::OK;
        } catch (const RentalError& e) {
            return e.to_grpc_status();
        }
    }

    grpc::Status Restitute(grpc::ServerContext* context,
                           const RestituteRequest* request,
                           RestituteResponse* response) override {
        try {
            IdList line_ids(request->line_ids().begin(), request->line_ids().end());
            std::optional<Date> return_date;
            if (request->has_actual_return_date()) return_date = request->actual_return_date();

            for (const auto& line : restitutions_.restitute(line_ids, return_date)) {
                *response->add_lines() = line;
            }
            return grpc::Status::OK;
        } catch (const RentalError& e) {
            return e.to_grpc_status();
        }
    }

    grpc::Status ListOpenLines(grpc::ServerContext* context,
                               const ListOpenLinesRequest* request,
                               ListOpenLinesResponse* response) override {
        try {
            auto uow = store_.begin();
            for (const auto& line : uow->open_lines()) *response->add_lines() = line;
            uow->commit();
            return grpc::Status::OK;
        } catch (const RentalError& e) {
            log_error("rental_service", "list_open_lines_failed", {{"error", e.what()}});
            return e.to_grpc_status();
        }
    }

    grpc::Status GetContractSummary(grpc::ServerContext* context,
                                    const ContractSummaryRequest* request,
                                    ContractSummary* response) override {
        try {
            Date as_of = helpers::today();
            if (request->has_as_of()) {
                if (!helpers::is_valid(request->as_of())) {
                    throw ValidationError("as_of is not a valid date");
                }
                as_of = request->as_of();
            }

            auto uow = store_.begin();
            auto contract = uow->find_contract(request->contract_id());
            if (!contract) {
                throw NotFoundError("contract", {request->contract_id()});
            }
            *response = summarize_contract(*contract, uow->lines_of_contract(contract->id()), as_of);
            uow->commit();
            return grpc::Status::OK;
        } catch (const RentalError& e) {
            return e.to_grpc_status();
        }
    }

private:
    Store& store_;
    ReservationCoordinator& reservations_;
    RestitutionCoordinator& restitutions_;
};

std::unique_ptr<RentalService::Service> create_rental_service(
    Store& store, ReservationCoordinator& reservations, RestitutionCoordinator& restitutions) {
    return std::make_unique<RentalServiceImpl>(store, reservations, restitutions);
}

} // namespace locamat
