#pragma once

#include "enums/AllocationStatus.hpp"
#include "Money.hpp"
#include <optional>
#include <string>
#include <vector>

namespace budget::domain {

/**
 * @brief Параметры прогона распределения
 */
struct AllocationRunRequest {
    std::string periodId;
    std::string sourceAccountId;
    Money pool;
    bool reprocess = false;     ///< Сначала сторнировать прежние распределения периода
};

/**
 * @brief Итог по одному шаблону
 */
struct TemplateOutcome {
    std::string templateId;
    std::string destinationAccountId;
    AllocationStatus status = AllocationStatus::SKIPPED_NOTHING_DUE;
    Money nominal;              ///< Сколько причиталось по правилу
    Money allocated;            ///< Сколько реально переведено
    std::optional<std::string> allocationId;
    std::string error;
};

/**
 * @brief Отчёт о прогоне распределения
 */
struct AllocationReport {
    std::string periodId;
    std::string sourceAccountId;
    Money pool;
    Money totalAllocated;
    Money remainingPool;
    int reversedAllocations = 0;
    std::vector<TemplateOutcome> outcomes;

    size_t countWithStatus(AllocationStatus status) const {
        size_t count = 0;
        for (const auto& outcome : outcomes) {
            if (outcome.status == status) {
                ++count;
            }
        }
        return count;
    }
};

} // namespace budget::domain
