#pragma once

#include "AllocationRun.hpp"
#include "Date.hpp"
#include "Money.hpp"
#include <optional>
#include <string>
#include <vector>

namespace budget::domain {

/**
 * @brief Итог еженедельной обработки владельца
 */
struct WeeklyRunReport {
    std::string ownerId;
    Date date;
    std::string periodId;
    std::optional<AllocationReport> allocation;     ///< nullopt если автораспределение выключено или пул пуст
    std::string allocationSkippedReason;
    int loansAccrued = 0;
    Money interestAccrued;
    int repaymentsMade = 0;
    Money totalRepaid;
    std::vector<std::string> errors;
};

} // namespace budget::domain
