#pragma once

#include <memory>
#include "locamat/rental.grpc.pb.h"
#include "reservation.hpp"
#include "restitution.hpp"
#include "store.hpp"

namespace locamat {

/**
 * gRPC adapter over the coordinators. Rental errors become gRPC statuses
 * through RentalError::to_grpc_status().
 */
std::unique_ptr<RentalService::Service> create_rental_service(
    Store& store, ReservationCoordinator& reservations, RestitutionCoordinator& restitutions);

} // namespace locamat
