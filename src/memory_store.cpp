#include "locamat/memory_store.hpp"

#include <set>
#include "locamat/helpers.hpp"

namespace locamat {

/**
 * Unit of work over a MemoryStore. Staged rows shadow committed ones until
 * commit() copies them into the store's tables.
 */
class MemoryUnitOfWork : public UnitOfWork {
public:
    MemoryUnitOfWork(MemoryStore& store, uint64_t owner)
        : store_(store), owner_(owner) {}

    ~MemoryUnitOfWork() override { rollback(); }

    std::optional<Client> find_client(int64_t client_id) override {
        ensure_active();
        std::lock_guard<std::mutex> guard(store_.mutex_);
        auto it = store_.clients_.find(client_id);
        if (it == store_.clients_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<Contract> find_contract(int64_t contract_id) override {
        ensure_active();
        std::lock_guard<std::mutex> guard(store_.mutex_);
        return find_contract_locked(contract_id);
    }

    std::optional<ContractWithLines> latest_contract(int64_t client_id) override {
        ensure_active();
        std::lock_guard<std::mutex> guard(store_.mutex_);
        std::optional<Contract> latest;
        auto consider = [&](const Contract& contract) {
            if (contract.client_id() != client_id) return;
            if (!latest || contract.id() > latest->id()) latest = contract;
        };
        for (const auto& [id, contract] : store_.contracts_) consider(contract);
        for (const auto& [id, contract] : staged_contracts_) consider(contract);
        if (!latest) return std::nullopt;

        const int64_t contract_id = latest->id();
        ContractWithLines result;
        result.contract = *latest;
        result.lines = select_lines_locked([contract_id](const ContractLine& line) {
            return line.contract_id() == contract_id;
        });
        return result;
    }

    std::vector<ContractLine> lines_of_contract(int64_t contract_id) override {
        ensure_active();
        std::lock_guard<std::mutex> guard(store_.mutex_);
        return select_lines_locked([contract_id](const ContractLine& line) {
            return line.contract_id() == contract_id;
        });
    }

    std::vector<ContractLine> open_lines() override {
        ensure_active();
        std::lock_guard<std::mutex> guard(store_.mutex_);
        return select_lines_locked([](const ContractLine& line) {
            return !line.has_actual_return_date();
        });
    }

    std::vector<EquipmentUnit> lock_units(const IdList& unit_ids) override {
        return lock_rows(unit_ids, store_.units_, staged_units_, store_.unit_locks_, held_units_);
    }

    std::vector<ContractLine> lock_lines(const IdList& line_ids) override {
        return lock_rows(line_ids, store_.lines_, staged_lines_, store_.line_locks_, held_lines_);
    }

    Contract insert_contract(Contract contract) override {
        ensure_active();
        std::lock_guard<std::mutex> guard(store_.mutex_);
        if (store_.clients_.count(contract.client_id()) == 0) {
            throw StorageError("contract references unknown client " +
                               std::to_string(contract.client_id()));
        }
        contract.set_id(store_.next_contract_id_++);
        staged_contracts_[contract.id()] = contract;
        return contract;
    }

    ContractLine insert_line(ContractLine line) override {
        ensure_active();
        std::lock_guard<std::mutex> guard(store_.mutex_);
        if (!find_contract_locked(line.contract_id())) {
            throw StorageError("line references unknown contract " +
                               std::to_string(line.contract_id()));
        }
        if (store_.units_.count(line.unit_id()) == 0) {
            throw StorageError("line references unknown equipment " +
                               std::to_string(line.unit_id()));
        }
        line.set_id(store_.next_line_id_++);
        staged_lines_[line.id()] = line;
        held_lines_.insert(line.id());
        return line;
    }

    void update_unit(const EquipmentUnit& unit) override {
        ensure_active();
        require_held(held_units_, unit.id(), "equipment");
        staged_units_[unit.id()] = unit;
    }

    void update_line(const ContractLine& line) override {
        ensure_active();
        require_held(held_lines_, line.id(), "line");
        if (line.has_penalty() != line.has_actual_return_date() ||
            (line.has_penalty() && line.penalty().cents() < 0)) {
            throw StorageError("line " + std::to_string(line.id()) +
                               " violates the penalty constraint");
        }
        std::lock_guard<std::mutex> guard(store_.mutex_);
        const ContractLine* current = find_line_locked(line.id());
        if (current && current->has_actual_return_date() &&
            (!line.has_actual_return_date() ||
             helpers::days_between(current->actual_return_date(),
                                   line.actual_return_date()) != 0)) {
            throw StorageError("line " + std::to_string(line.id()) +
                               " already has an actual return date");
        }
        staged_lines_[line.id()] = line;
    }

    void commit() override {
        ensure_active();
        {
            std::lock_guard<std::mutex> guard(store_.mutex_);
            for (const auto& [contract_id, contract] : staged_contracts_) {
                bool has_line = false;
                for (const auto& [line_id, line] : staged_lines_) {
                    if (line.contract_id() == contract_id) {
                        has_line = true;
                        break;
                    }
                }
                if (!has_line) {
                    throw StorageError("contract " + std::to_string(contract_id) +
                                       " has no lines");
                }
            }

            for (const auto& [id, contract] : staged_contracts_) store_.contracts_[id] = contract;
            for (const auto& [id, line] : staged_lines_) store_.lines_[id] = line;
            for (const auto& [id, unit] : staged_units_) store_.units_[id] = unit;

            store_.release_locks(owner_);
            finished_ = true;
        }
        store_.lock_released_.notify_all();
        clear_staged();
    }

    void rollback() override {
        if (finished_) return;
        {
            std::lock_guard<std::mutex> guard(store_.mutex_);
            store_.release_locks(owner_);
            finished_ = true;
        }
        store_.lock_released_.notify_all();
        clear_staged();
    }

private:
    void ensure_active() const {
        if (finished_) {
            throw StorageError("unit of work already finished");
        }
    }

    static void require_held(const std::set<int64_t>& held, int64_t id, const std::string& table) {
        if (held.count(id) == 0) {
            throw StorageError(table + " row " + std::to_string(id) + " is not locked");
        }
    }

    // Caller holds store_.mutex_.
    std::optional<Contract> find_contract_locked(int64_t contract_id) const {
        auto staged = staged_contracts_.find(contract_id);
        if (staged != staged_contracts_.end()) return staged->second;
        auto committed = store_.contracts_.find(contract_id);
        if (committed != store_.contracts_.end()) return committed->second;
        return std::nullopt;
    }

    // Caller holds store_.mutex_.
    const ContractLine* find_line_locked(int64_t line_id) const {
        auto staged = staged_lines_.find(line_id);
        if (staged != staged_lines_.end()) return &staged->second;
        auto committed = store_.lines_.find(line_id);
        if (committed != store_.lines_.end()) return &committed->second;
        return nullptr;
    }

    // Caller holds store_.mutex_. Walks committed and staged lines together in
    // ascending id order, a staged row shadowing the committed one.
    template<typename Predicate>
    std::vector<ContractLine> select_lines_locked(Predicate matches) const {
        std::vector<ContractLine> result;
        auto committed = store_.lines_.begin();
        auto staged = staged_lines_.begin();
        while (committed != store_.lines_.end() || staged != staged_lines_.end()) {
            const ContractLine* line;
            if (staged == staged_lines_.end() ||
                (committed != store_.lines_.end() && committed->first < staged->first)) {
                line = &committed->second;
                ++committed;
            } else {
                if (committed != store_.lines_.end() && committed->first == staged->first) {
                    ++committed;
                }
                line = &staged->second;
                ++staged;
            }
            if (matches(*line)) result.push_back(*line);
        }
        return result;
    }

    template<typename Row>
    std::vector<Row> lock_rows(const IdList& ids,
                               const std::map<int64_t, Row>& committed,
                               const std::map<int64_t, Row>& staged,
                               MemoryStore::LockTable& locks,
                               std::set<int64_t>& held) {
        ensure_active();
        std::vector<Row> rows;
        std::unique_lock<std::mutex> guard(store_.mutex_);
        for (int64_t id : helpers::sorted_unique(ids)) {
            auto staged_it = staged.find(id);
            if (staged_it == staged.end() && committed.count(id) == 0) continue;

            if (held.count(id) == 0) {
                auto deadline = std::chrono::steady_clock::now() + store_.lock_timeout_;
                bool acquired = store_.lock_released_.wait_until(guard, deadline, [&] {
                    return locks.count(id) == 0;
                });
                if (!acquired) {
                    throw ConflictError::lock_timeout({id});
                }
                locks[id] = owner_;
                held.insert(id);
            }

            // Re-read after the wait: the previous owner may have committed.
            rows.push_back(staged_it != staged.end() ? staged_it->second : committed.at(id));
        }
        return rows;
    }

    void clear_staged() {
        staged_contracts_.clear();
        staged_lines_.clear();
        staged_units_.clear();
        held_units_.clear();
        held_lines_.clear();
    }

    MemoryStore& store_;
    const uint64_t owner_;
    bool finished_ = false;

    std::map<int64_t, Contract> staged_contracts_;
    std::map<int64_t, ContractLine> staged_lines_;
    std::map<int64_t, EquipmentUnit> staged_units_;
    std::set<int64_t> held_units_;
    std::set<int64_t> held_lines_;
};

MemoryStore::MemoryStore(std::chrono::milliseconds lock_timeout)
    : lock_timeout_(lock_timeout) {
    if (lock_timeout <= std::chrono::milliseconds::zero() || lock_timeout > kMaxLockTimeout) {
        throw InvalidArgumentError("lock timeout must be within (0, " +
                                   std::to_string(kMaxLockTimeout.count()) + "] ms");
    }
}

MemoryStore::~MemoryStore() = default;

std::unique_ptr<UnitOfWork> MemoryStore::begin() {
    std::lock_guard<std::mutex> guard(mutex_);
    return std::make_unique<MemoryUnitOfWork>(*this, next_owner_++);
}

void MemoryStore::add_client(const Client& client) {
    std::lock_guard<std::mutex> guard(mutex_);
    if (clients_.count(client.id()) > 0) {
        throw InvalidArgumentError("duplicate client id " + std::to_string(client.id()));
    }
    clients_[client.id()] = client;
}

void MemoryStore::add_unit(const EquipmentUnit& unit) {
    switch (unit.status()) {
        case AVAILABLE:
        case MAINTENANCE:
        case SCRAPPED:
            break;
        case RENTED:
            throw InvalidArgumentError("equipment " + std::to_string(unit.id()) +
                                       " cannot be provisioned as rented");
        default:
            throw InvalidArgumentError("equipment " + std::to_string(unit.id()) +
                                       " has no status");
    }

    std::lock_guard<std::mutex> guard(mutex_);
    if (units_.count(unit.id()) > 0) {
        throw InvalidArgumentError("duplicate equipment id " + std::to_string(unit.id()));
    }
    for (const auto& [id, existing] : units_) {
        if (existing.serial() == unit.serial()) {
            throw InvalidArgumentError("duplicate equipment serial " + unit.serial());
        }
    }
    units_[unit.id()] = unit;
}

std::optional<EquipmentUnit> MemoryStore::find_unit(int64_t unit_id) const {
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = units_.find(unit_id);
    if (it == units_.end()) return std::nullopt;
    return it->second;
}

std::optional<ContractLine> MemoryStore::find_line(int64_t line_id) const {
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = lines_.find(line_id);
    if (it == lines_.end()) return std::nullopt;
    return it->second;
}

std::vector<EquipmentUnit> MemoryStore::units() const {
    std::lock_guard<std::mutex> guard(mutex_);
    std::vector<EquipmentUnit> result;
    for (const auto& [id, unit] : units_) result.push_back(unit);
    return result;
}

std::vector<Contract> MemoryStore::contracts() const {
    std::lock_guard<std::mutex> guard(mutex_);
    std::vector<Contract> result;
    for (const auto& [id, contract] : contracts_) result.push_back(contract);
    return result;
}

std::vector<ContractLine> MemoryStore::lines() const {
    std::lock_guard<std::mutex> guard(mutex_);
    std::vector<ContractLine> result;
    for (const auto& [id, line] : lines_) result.push_back(line);
    return result;
}

// Caller holds mutex_.
void MemoryStore::release_locks(uint64_t owner) {
    for (LockTable* table : {&unit_locks_, &line_locks_}) {
        for (auto it = table->begin(); it != table->end();) {
            if (it->second == owner) {
                it = table->erase(it);
            } else {
                ++it;
            }
        }
    }
}

} // namespace locamat
