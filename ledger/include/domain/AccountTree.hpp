#pragma once

#include "Account.hpp"
#include <map>
#include <string>
#include <vector>

namespace budget::domain {

/**
 * @brief Лес счетов владельца в виде списков смежности
 *
 * roots и children упорядочены по sortOrder, затем по имени.
 */
struct AccountTree {
    std::string ownerId;
    std::map<std::string, Account> accounts;                     ///< id → счёт
    std::vector<std::string> roots;                              ///< Счета верхнего уровня
    std::map<std::string, std::vector<std::string>> children;    ///< parentId → дети

    const std::vector<std::string>& childrenOf(const std::string& id) const {
        static const std::vector<std::string> empty;
        auto it = children.find(id);
        return it == children.end() ? empty : it->second;
    }
};

} // namespace budget::domain
