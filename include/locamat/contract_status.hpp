#pragma once

#include <vector>
#include "locamat/rental.pb.h"
#include "locamat/types.pb.h"

namespace locamat {

/**
 * CONTRACT_CLOSED when every line is returned, CONTRACT_OVERDUE when an
 * unreturned line is past its planned return date, CONTRACT_OPEN otherwise.
 */
ContractStatus classify_contract(const std::vector<ContractLine>& lines, const Date& today);

/**
 * Status, number of unreturned lines and sum of recorded penalties.
 */
ContractSummary summarize_contract(const Contract& contract,
                                   const std::vector<ContractLine>& lines,
                                   const Date& today);

} // namespace locamat
