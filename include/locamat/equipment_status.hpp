#pragma once

#include <string>
#include "locamat/types.pb.h"

namespace locamat {

/**
 * Status transitions driven by the reservation and restitution coordinators.
 * Maintenance and scrapping are managed outside the engine.
 */
namespace equipment_status {

/**
 * True if a unit in this status may be reserved.
 */
bool is_rentable(EquipmentStatus status);

/**
 * Status after a reservation. Only AVAILABLE units may be reserved.
 * @throws ConflictError for any other status
 */
EquipmentStatus on_reserve(const EquipmentUnit& unit);

/**
 * Status after the unit's open line is returned.
 * @throws StorageError if the unit is not RENTED, which means stored state
 *         already broke the rented/open-line correspondence
 */
EquipmentStatus on_return(const EquipmentUnit& unit);

std::string name(EquipmentStatus status);

} // namespace equipment_status
} // namespace locamat
