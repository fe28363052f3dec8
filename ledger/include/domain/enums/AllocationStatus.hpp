#pragma once

#include <string>
#include <stdexcept>

namespace budget::domain {

/**
 * @brief Итог обработки одного шаблона в прогоне распределения
 */
enum class AllocationStatus {
    FUNDED,                     ///< Выделена полная сумма
    PARTIALLY_FUNDED,           ///< Пула не хватило на фиксированную сумму
    SKIPPED_BELOW_FLOOR,        ///< Остаток меньше минимума диапазона
    SKIPPED_POOL_EXHAUSTED,     ///< Пул уже исчерпан
    SKIPPED_NOTHING_DUE,        ///< Расчётная сумма округлилась до нуля
    SKIPPED_ALREADY_PROCESSED,  ///< Шаблон уже обработан в этом периоде
    FAILED                      ///< Ошибка при проводке, прогон продолжен
};

inline std::string toString(AllocationStatus status) {
    switch (status) {
        case AllocationStatus::FUNDED:                    return "FUNDED";
        case AllocationStatus::PARTIALLY_FUNDED:          return "PARTIALLY_FUNDED";
        case AllocationStatus::SKIPPED_BELOW_FLOOR:       return "SKIPPED_BELOW_FLOOR";
        case AllocationStatus::SKIPPED_POOL_EXHAUSTED:    return "SKIPPED_POOL_EXHAUSTED";
        case AllocationStatus::SKIPPED_NOTHING_DUE:       return "SKIPPED_NOTHING_DUE";
        case AllocationStatus::SKIPPED_ALREADY_PROCESSED: return "SKIPPED_ALREADY_PROCESSED";
        case AllocationStatus::FAILED:                    return "FAILED";
    }
    return "UNKNOWN";
}

/**
 * @brief Создана ли проводка по шаблону
 */
inline bool isFunded(AllocationStatus status) {
    return status == AllocationStatus::FUNDED || status == AllocationStatus::PARTIALLY_FUNDED;
}

} // namespace budget::domain
