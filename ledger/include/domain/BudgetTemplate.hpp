#pragma once

#include "LedgerError.hpp"
#include "Money.hpp"
#include "Rate.hpp"
#include "Timestamp.hpp"
#include <cstdint>
#include <string>
#include <variant>

namespace budget::domain {

/// Фиксированная сумма за период
struct FixedRule {
    Money amount;
};

/// Процент от исходного пула, (0, 100]
struct PercentageRule {
    Rate percentage;
};

/// Диапазон: минимум обязателен, сверх него до максимума по остатку
struct RangeRule {
    Money min;
    Money max;
};

using AllocationRule = std::variant<FixedRule, PercentageRule, RangeRule>;

inline std::string ruleTypeName(const AllocationRule& rule) {
    switch (rule.index()) {
        case 0: return "FIXED";
        case 1: return "PERCENTAGE";
        case 2: return "RANGE";
    }
    return "UNKNOWN";
}

/**
 * @brief Проверить параметры правила
 * @throws InvalidAmount если правило недопустимо
 */
inline void validateRule(const AllocationRule& rule) {
    if (auto fixed = std::get_if<FixedRule>(&rule)) {
        if (!fixed->amount.isPositive()) {
            throw InvalidAmount("Fixed amount must be positive");
        }
    } else if (auto percent = std::get_if<PercentageRule>(&rule)) {
        if (percent->percentage <= Rate::zero() || percent->percentage > Rate::fromString("100")) {
            throw InvalidAmount("Percentage must be within (0, 100]");
        }
    } else if (auto range = std::get_if<RangeRule>(&rule)) {
        if (range->min.isNegative() || range->min > range->max || !range->max.isPositive()) {
            throw InvalidAmount("Range must satisfy 0 <= min <= max and max > 0");
        }
    }
}

/**
 * @brief Шаблон бюджета: куда и по какому правилу распределять пул
 *
 * Меньший priority обрабатывается раньше, при равенстве - по порядку создания.
 */
struct BudgetTemplate {
    std::string id;
    std::string ownerId;
    std::string destinationAccountId;
    AllocationRule rule = FixedRule{};
    int priority = 0;
    int64_t creationOrder = 0;      ///< Назначает репозиторий
    bool active = true;
    std::string notes;
    Timestamp createdAt;

    BudgetTemplate() = default;

    BudgetTemplate(
        const std::string& id,
        const std::string& ownerId,
        const std::string& destinationAccountId,
        const AllocationRule& rule,
        int priority
    ) : id(id), ownerId(ownerId), destinationAccountId(destinationAccountId),
        rule(rule), priority(priority), createdAt(Timestamp::now()) {}
};

/**
 * @brief Порядок обработки шаблонов в прогоне
 */
inline bool runsBefore(const BudgetTemplate& a, const BudgetTemplate& b) {
    if (a.priority != b.priority) {
        return a.priority < b.priority;
    }
    return a.creationOrder < b.creationOrder;
}

} // namespace budget::domain
