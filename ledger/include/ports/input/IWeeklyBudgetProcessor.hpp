#pragma once

#include "domain/Date.hpp"
#include "domain/WeeklyRunReport.hpp"
#include <optional>
#include <string>

namespace budget::ports::input {

/**
 * @brief Параметры еженедельной обработки
 */
struct WeeklyRunOptions {
    std::optional<std::string> sourceAccountId;     ///< По умолчанию первый активный корневой INCOME
    bool force = false;                             ///< Переобработать распределения периода
};

/**
 * @brief Еженедельная обработка владельца
 *
 * Вызывается внешним планировщиком: распределение дохода периода,
 * начисление процентов, автопогашения.
 */
class IWeeklyBudgetProcessor {
public:
    virtual ~IWeeklyBudgetProcessor() = default;

    virtual domain::WeeklyRunReport process(
        const std::string& ownerId,
        const domain::Date& date,
        const WeeklyRunOptions& options = {}
    ) = 0;
};

} // namespace budget::ports::input
