#include "locamat/contract_status.hpp"
#include "locamat/helpers.hpp"

namespace locamat {

ContractStatus classify_contract(const std::vector<ContractLine>& lines, const Date& today) {
    bool open = false;
    for (const auto& line : lines) {
        if (line.has_actual_return_date()) continue;
        if (helpers::is_before(line.planned_return_date(), today)) return CONTRACT_OVERDUE;
        open = true;
    }
    return open ? CONTRACT_OPEN : CONTRACT_CLOSED;
}

ContractSummary summarize_contract(const Contract& contract,
                                   const std::vector<ContractLine>& lines,
                                   const Date& today) {
    ContractSummary summary;
    *summary.mutable_contract() = contract;
    summary.set_status(classify_contract(lines, today));

    int32_t open_lines = 0;
    int64_t penalties = 0;
    for (const auto& line : lines) {
        if (!line.has_actual_return_date()) ++open_lines;
        if (line.has_penalty()) penalties += line.penalty().cents();
    }
    summary.set_open_lines(open_lines);
    *summary.mutable_total_penalties() = helpers::make_money(penalties);
    return summary;
}

} // namespace locamat
