#pragma once

#include "BudgetTemplate.hpp"
#include <optional>
#include <string>

namespace budget::domain {

/**
 * @brief Создание шаблона
 */
struct TemplateRequest {
    std::string destinationAccountId;
    AllocationRule rule = FixedRule{};
    int priority = 0;
    bool active = true;
    std::string notes;
};

/**
 * @brief Частичное обновление шаблона: меняются только заданные поля
 */
struct TemplateUpdate {
    std::optional<std::string> destinationAccountId;
    std::optional<AllocationRule> rule;
    std::optional<int> priority;
    std::optional<bool> active;
    std::optional<std::string> notes;
};

} // namespace budget::domain
