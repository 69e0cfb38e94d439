#include "locamat/config.hpp"
#include "locamat/errors.hpp"
#include "locamat/helpers.hpp"
#include "locamat/logging.hpp"
#include "locamat/memory_store.hpp"
#include "locamat/rental_service.hpp"
#include "locamat/reservation.hpp"
#include "locamat/restitution.hpp"
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <memory>
#include <string>

int main(int argc, char** argv) {
    locamat::EngineConfig config;
    try {
        config = locamat::EngineConfig::from_env();
    } catch (const locamat::RentalError& e) {
        locamat::log_error("server", "invalid_configuration", {{"error", e.what()}});
        return 1;
    }

    locamat::MemoryStore store(config.lock_timeout);
    if (!config.seed_file.empty()) {
        try {
            locamat::load_seed_file(config.seed_file, store);
        } catch (const locamat::RentalError& e) {
            locamat::log_error("server", "seed_failed",
                               {{"seed_file", config.seed_file}, {"error", e.what()}});
            return 1;
        }
    }

    locamat::ReservationCoordinator reservations(store);
    locamat::RestitutionCoordinator restitutions(store, config.penalty_rate_per_day);

    std::string server_address = "0.0.0.0:" + config.port;

    grpc::EnableDefaultHealthCheckService(true);

    auto service = locamat::create_rental_service(store, reservations, restitutions);

    grpc::ServerBuilder builder;
    builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
    builder.RegisterService(service.get());

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        locamat::log_error("server", "listen_failed", {{"address", server_address}});
        return 1;
    }

    locamat::log_info("server", "rental_server_started",
                      {{"port", config.port},
                       {"penalty_per_day", locamat::helpers::format_money(config.penalty_rate_per_day)},
                       {"lock_timeout_ms", config.lock_timeout.count()},
                       {"units", store.units().size()}});

    server->Wait();

    return 0;
}
