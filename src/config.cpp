#include "locamat/config.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include "locamat/errors.hpp"
#include "locamat/helpers.hpp"
#include "locamat/restitution.hpp"

namespace locamat {

namespace {

const char* env_or_null(const char* name) {
    const char* value = std::getenv(name);
    return value && *value ? value : nullptr;
}

EquipmentStatus parse_status(const std::string& text) {
    if (text == "available") return AVAILABLE;
    if (text == "maintenance") return MAINTENANCE;
    if (text == "scrapped") return SCRAPPED;
    throw InvalidArgumentError("unknown equipment status '" + text + "'");
}

Client parse_client(const nlohmann::json& entry) {
    Client client;
    client.set_id(entry.at("id").get<int64_t>());
    client.set_first_name(entry.value("first_name", ""));
    client.set_last_name(entry.value("last_name", ""));
    client.set_address(entry.value("address", ""));
    client.set_postcode(entry.value("postcode", ""));
    client.set_phone(entry.value("phone", ""));
    client.set_email(entry.value("email", ""));

    auto vip = entry.find("vip");
    if (vip == entry.end() || vip->is_null()) {
        client.set_vip(VIP_UNKNOWN);
    } else {
        client.set_vip(vip->get<bool>() ? VIP_YES : VIP_NO);
    }
    return client;
}

EquipmentUnit parse_unit(const nlohmann::json& entry) {
    EquipmentUnit unit;
    unit.set_id(entry.at("id").get<int64_t>());
    unit.set_serial(entry.at("serial").get<std::string>());
    unit.set_model_id(entry.value("model_id", int64_t{0}));
    *unit.mutable_daily_rate() = helpers::parse_money(entry.at("daily_rate").get<std::string>());
    unit.set_status(parse_status(entry.value("status", std::string("available"))));
    return unit;
}

} // anonymous namespace

EngineConfig::EngineConfig()
    : penalty_rate_per_day(helpers::make_money(RestitutionCoordinator::kDefaultPenaltyPerDayCents)) {}

EngineConfig EngineConfig::from_env() {
    EngineConfig config;

    if (const char* port = env_or_null("PORT")) {
        config.port = port;
    }
    if (const char* penalty = env_or_null("LOCAMAT_PENALTY_PER_DAY")) {
        config.penalty_rate_per_day = helpers::parse_money(penalty);
    }
    if (const char* timeout = env_or_null("LOCAMAT_LOCK_TIMEOUT_MS")) {
        char* end = nullptr;
        errno = 0;
        long long millis = std::strtoll(timeout, &end, 10);
        if (*end != '\0' || errno == ERANGE || millis <= 0 ||
            millis > MemoryStore::kMaxLockTimeout.count()) {
            throw InvalidArgumentError("LOCAMAT_LOCK_TIMEOUT_MS must be an integer within (0, " +
                                       std::to_string(MemoryStore::kMaxLockTimeout.count()) + "]");
        }
        config.lock_timeout = std::chrono::milliseconds(millis);
    }
    if (const char* seed = env_or_null("LOCAMAT_SEED_FILE")) {
        config.seed_file = seed;
    }
    return config;
}

void load_seed(const nlohmann::json& seed, MemoryStore& store) {
    try {
        if (seed.contains("clients")) {
            for (const auto& entry : seed.at("clients")) store.add_client(parse_client(entry));
        }
        if (seed.contains("units")) {
            for (const auto& entry : seed.at("units")) store.add_unit(parse_unit(entry));
        }
    } catch (const nlohmann::json::exception& e) {
        throw InvalidArgumentError(std::string("malformed seed: ") + e.what());
    }
}

void load_seed_file(const std::string& path, MemoryStore& store) {
    std::ifstream in(path);
    if (!in) {
        throw InvalidArgumentError("cannot open seed file " + path);
    }
    nlohmann::json seed;
    try {
        in >> seed;
    } catch (const nlohmann::json::exception& e) {
        throw InvalidArgumentError("cannot parse seed file " + path + ": " + e.what());
    }
    load_seed(seed, store);
}

} // namespace locamat
