#pragma once

#include <cstdint>
#include "store.hpp"

namespace locamat {

/**
 * Flags clients whose most recent contract was returned late.
 *
 * Only the contract with the highest id is consulted: a client is risky if
 * any line of that contract came back after its planned return date. Older
 * contracts are ignored. Reads only; takes no locks.
 */
class RiskClassifier {
public:
    explicit RiskClassifier(Store& store) : store_(store) {}

    /**
     * Classify inside its own read-only unit of work.
     */
    bool is_risky(int64_t client_id) const;

    /**
     * Classify with the caller's unit of work, sharing its view of the store.
     */
    static bool is_risky(UnitOfWork& uow, int64_t client_id);

private:
    Store& store_;
};

} // namespace locamat
