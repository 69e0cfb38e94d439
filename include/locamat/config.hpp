#pragma once

#include <chrono>
#include <string>
#include <nlohmann/json.hpp>
#include "locamat/types.pb.h"
#include "memory_store.hpp"

namespace locamat {

/**
 * Server configuration, read from the environment:
 *
 *   PORT                     gRPC listen port (default 51000)
 *   LOCAMAT_PENALTY_PER_DAY  late fee per day, decimal (default 5.00)
 *   LOCAMAT_LOCK_TIMEOUT_MS  row lock wait before a transaction aborts (default 5000, at most 24h)
 *   LOCAMAT_SEED_FILE        JSON fixture of clients and units to provision
 */
struct EngineConfig {
    std::string port = "51000";
    Money penalty_rate_per_day;
    std::chrono::milliseconds lock_timeout = MemoryStore::kDefaultLockTimeout;
    std::string seed_file;

    EngineConfig();

    /**
     * @throws InvalidArgumentError on a malformed value
     */
    static EngineConfig from_env();
};

/**
 * Provision clients and units from a fixture:
 *
 *   {"clients": [{"id": 1, "first_name": "Ada", ..., "vip": true}],
 *    "units":   [{"id": 10, "serial": "SN-10", "model_id": 2,
 *                 "daily_rate": "100.00", "status": "available"}]}
 *
 * "vip" may be true, false or absent (unknown). "status" is available,
 * maintenance or scrapped, and defaults to available.
 * @throws InvalidArgumentError on a malformed fixture
 */
void load_seed(const nlohmann::json& seed, MemoryStore& store);

/**
 * @throws InvalidArgumentError if the file cannot be read or parsed
 */
void load_seed_file(const std::string& path, MemoryStore& store);

} // namespace locamat
