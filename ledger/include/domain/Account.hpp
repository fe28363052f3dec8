#pragma once

#include "enums/AccountCategory.hpp"
#include "Money.hpp"
#include "Timestamp.hpp"
#include <optional>
#include <string>
#include <vector>

namespace budget::domain {

/**
 * @brief Счёт в дереве счетов владельца
 *
 * Дочерний счёт существует только внутри родителя. Счёт с детьми
 * может сам держать баланс. currentBalance - кэш, истина в журнале.
 */
struct Account {
    std::string id;                         ///< UUID счёта
    std::string ownerId;                    ///< Владелец (семья); пустой только у битых записей
    std::string name;                       ///< Уникально среди соседей
    AccountCategory category = AccountCategory::EXPENSE;
    std::optional<std::string> parentId;    ///< Родитель, nullopt у верхнего уровня
    std::optional<Money> targetAmount;      ///< Цель накопления
    Money currentBalance;                   ///< Кэш баланса
    bool active = true;
    int sortOrder = 0;
    bool isRoot = false;                    ///< Счёт по умолчанию верхнего уровня
    std::string description;
    Timestamp createdAt;

    Account() = default;

    Account(
        const std::string& id,
        const std::string& ownerId,
        const std::string& name,
        AccountCategory category,
        const std::optional<std::string>& parentId = std::nullopt
    ) : id(id), ownerId(ownerId), name(name), category(category),
        parentId(parentId), createdAt(Timestamp::now()) {}

    bool isTopLevel() const { return !parentId.has_value(); }
};

/**
 * @brief Результат удаления счёта
 *
 * Поддерево без проводок удаляется физически, иначе деактивируется.
 */
struct AccountRemoval {
    bool hardDeleted = false;
    std::vector<std::string> accountIds;    ///< Затронутые счета (сам счёт и потомки)
};

} // namespace budget::domain
