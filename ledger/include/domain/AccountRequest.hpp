#pragma once

#include "enums/AccountCategory.hpp"
#include "Money.hpp"
#include <optional>
#include <string>

namespace budget::domain {

/**
 * @brief Запрос на создание счёта
 */
struct AccountRequest {
    std::string name;
    AccountCategory category = AccountCategory::EXPENSE;
    std::optional<std::string> parentId;
    std::optional<Money> targetAmount;
    int sortOrder = 0;
    std::string description;
    bool isRoot = false;
};

} // namespace budget::domain
