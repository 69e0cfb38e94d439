#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>
#include "locamat/types.pb.h"
#include "errors.hpp"

namespace locamat {

/**
 * A contract and its lines, read in one step.
 */
struct ContractWithLines {
    Contract contract;
    std::vector<ContractLine> lines;
};

/**
 * One atomic unit of work against the rental store.
 *
 * Locking reads block until the row lock is free and keep it until commit()
 * or rollback(). Writes are staged and become visible to other units of work
 * only when commit() succeeds. Destroying an uncommitted unit of work rolls
 * it back.
 *
 * Usage:
 *   auto uow = store.begin();
 *   auto units = uow->lock_units({3, 1});   // locks 1 then 3
 *   units[0].set_status(RENTED);
 *   uow->update_unit(units[0]);
 *   uow->commit();
 */
class UnitOfWork {
public:
    virtual ~UnitOfWork() = default;

    // Plain reads. No locks are taken; rows are read at their last committed
    // state, overlaid with this unit of work's own staged writes.

    virtual std::optional<Client> find_client(int64_t client_id) = 0;

    virtual std::optional<Contract> find_contract(int64_t contract_id) = 0;

    /**
     * The client's contract with the highest id, if any, with its lines in
     * ascending id order. Both come from the same snapshot.
     */
    virtual std::optional<ContractWithLines> latest_contract(int64_t client_id) = 0;

    /**
     * Lines of a contract, ascending id.
     */
    virtual std::vector<ContractLine> lines_of_contract(int64_t contract_id) = 0;

    /**
     * Lines without an actual return date, ascending id.
     */
    virtual std::vector<ContractLine> open_lines() = 0;

    // Locking reads. Rows are locked one at a time in ascending id order and
    // only existing rows are returned, in that order. Unknown ids are skipped.
    // A lock wait past the store's timeout throws ConflictError::lock_timeout.

    virtual std::vector<EquipmentUnit> lock_units(const IdList& unit_ids) = 0;

    virtual std::vector<ContractLine> lock_lines(const IdList& line_ids) = 0;

    // Writes. Updates require the row lock held by this unit of work;
    // inserts assign the identifier.

    virtual Contract insert_contract(Contract contract) = 0;

    virtual ContractLine insert_line(ContractLine line) = 0;

    virtual void update_unit(const EquipmentUnit& unit) = 0;

    virtual void update_line(const ContractLine& line) = 0;

    /**
     * Publish staged writes atomically and release every lock.
     * @throws StorageError if a constraint is violated; nothing is published
     */
    virtual void commit() = 0;

    /**
     * Discard staged writes and release every lock. Safe to call twice.
     */
    virtual void rollback() = 0;
};

/**
 * Persistence collaborator of the coordinators: a factory of units of work.
 */
class Store {
public:
    virtual ~Store() = default;

    virtual std::unique_ptr<UnitOfWork> begin() = 0;
};

} // namespace locamat
