#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <vector>
#include "locamat/types.pb.h"
#include "store.hpp"

namespace locamat {

class MemoryUnitOfWork;

/**
 * In-process Store with row-level pessimistic locks.
 *
 * Each equipment and contract-line row has an exclusive lock owned by at most
 * one unit of work. Waiters block on a shared condition variable until the
 * owner commits or rolls back, or until the lock timeout elapses.
 */
class MemoryStore : public Store {
public:
    static constexpr std::chrono::milliseconds kDefaultLockTimeout{5000};
    static constexpr std::chrono::milliseconds kMaxLockTimeout{24 * 60 * 60 * 1000};

    /**
     * @throws InvalidArgumentError unless 0 < lock_timeout <= kMaxLockTimeout
     */
    explicit MemoryStore(std::chrono::milliseconds lock_timeout = kDefaultLockTimeout);
    ~MemoryStore() override;

    MemoryStore(const MemoryStore&) = delete;
    MemoryStore& operator=(const MemoryStore&) = delete;

    std::unique_ptr<UnitOfWork> begin() override;

    // Provisioning, outside any unit of work.

    /**
     * @throws InvalidArgumentError on a duplicate id
     */
    void add_client(const Client& client);

    /**
     * Units enter the store available, in maintenance or scrapped. Only a
     * reservation makes a unit rented.
     * @throws InvalidArgumentError on a duplicate id or serial, or a status
     *         that is unspecified or rented
     */
    void add_unit(const EquipmentUnit& unit);

    // Committed-state snapshots for reporting.

    std::optional<EquipmentUnit> find_unit(int64_t unit_id) const;
    std::optional<ContractLine> find_line(int64_t line_id) const;
    std::vector<EquipmentUnit> units() const;
    std::vector<Contract> contracts() const;
    std::vector<ContractLine> lines() const;

    std::chrono::milliseconds lock_timeout() const { return lock_timeout_; }

private:
    friend class MemoryUnitOfWork;

    // Row id -> id of the owning unit of work.
    using LockTable = std::map<int64_t, uint64_t>;

    void release_locks(uint64_t owner);

    const std::chrono::milliseconds lock_timeout_;

    mutable std::mutex mutex_;
    std::condition_variable lock_released_;

    std::map<int64_t, Client> clients_;
    std::map<int64_t, EquipmentUnit> units_;
    std::map<int64_t, Contract> contracts_;
    std::map<int64_t, ContractLine> lines_;

    LockTable unit_locks_;
    LockTable line_locks_;

    uint64_t next_owner_ = 1;
    int64_t next_contract_id_ = 1;
    int64_t next_line_id_ = 1;
};

} // namespace locamat
