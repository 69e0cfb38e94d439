#include "locamat/equipment_status.hpp"
#include "locamat/errors.hpp"

namespace locamat {
namespace equipment_status {

bool is_rentable(EquipmentStatus status) {
    switch (status) {
        case AVAILABLE:
            return true;
        case RENTED:
        case MAINTENANCE:
        case SCRAPPED:
            return false;
        default:
            return false;
    }
}

EquipmentStatus on_reserve(const EquipmentUnit& unit) {
    if (!is_rentable(unit.status())) {
        throw ConflictError("equipment unavailable", {unit.id()});
    }
    return RENTED;
}

EquipmentStatus on_return(const EquipmentUnit& unit) {
    switch (unit.status()) {
        case RENTED:
            return AVAILABLE;
        case AVAILABLE:
        case MAINTENANCE:
        case SCRAPPED:
        default:
            throw StorageError("equipment " + std::to_string(unit.id()) + " is " +
                               name(unit.status()) + " but has an open line");
    }
}

std::string name(EquipmentStatus status) {
    switch (status) {
        case AVAILABLE:
            return "available";
        case RENTED:
            return "rented";
        case MAINTENANCE:
            return "maintenance";
        case SCRAPPED:
            return "scrapped";
        default:
            return "unspecified";
    }
}

} // namespace equipment_status
} // namespace locamat
