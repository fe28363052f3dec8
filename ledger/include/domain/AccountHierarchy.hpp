#pragma once

#include "Account.hpp"
#include "AccountTree.hpp"
#include "LedgerError.hpp"
#include <algorithm>
#include <deque>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace budget::domain {

/**
 * @brief Чистые алгоритмы над деревом счетов одного владельца
 *
 * Работают со снимком счетов (id → Account), ничего не сохраняют.
 * Используются сервисом счетов для проверки структурных правок и
 * проверкой целостности для поиска циклов.
 */
class AccountHierarchy {
public:
    using Index = std::unordered_map<std::string, Account>;

    static Index index(const std::vector<Account>& accounts) {
        Index result;
        for (const auto& account : accounts) {
            result.emplace(account.id, account);
        }
        return result;
    }

    /**
     * @brief Встречается ли targetId в цепочке родителей, начиная с startId
     *
     * Сам startId тоже входит в цепочку.
     * @throws InvalidHierarchy если цепочка уже содержит цикл
     */
    static bool chainContains(const Index& index, const std::string& startId, const std::string& targetId) {
        std::unordered_set<std::string> visited;
        std::optional<std::string> current = startId;

        while (current) {
            if (*current == targetId) {
                return true;
            }
            if (!visited.insert(*current).second) {
                throw InvalidHierarchy("Parent chain of " + startId + " contains a cycle");
            }
            auto it = index.find(*current);
            if (it == index.end()) {
                return false;
            }
            current = it->second.parentId;
        }
        return false;
    }

    /**
     * @brief Корневой предок счёта (сам счёт, если он верхнего уровня)
     * @throws InvalidHierarchy при цикле или оборванной цепочке
     */
    static const Account& rootAncestor(const Index& index, const std::string& id) {
        std::unordered_set<std::string> visited;
        auto it = index.find(id);
        if (it == index.end()) {
            throw UnknownAccount(id);
        }

        while (it->second.parentId) {
            if (!visited.insert(it->first).second) {
                throw InvalidHierarchy("Parent chain of " + id + " contains a cycle");
            }
            auto parent = index.find(*it->second.parentId);
            if (parent == index.end()) {
                throw InvalidHierarchy("Parent chain of " + id + " is broken at " + it->first);
            }
            it = parent;
        }
        return it->second;
    }

    /**
     * @brief Все потомки счёта (в ширину, без самого счёта)
     */
    static std::vector<std::string> descendants(const Index& index, const std::string& id) {
        auto childMap = childrenIndex(index);

        std::vector<std::string> result;
        std::unordered_set<std::string> seen{id};
        std::deque<std::string> queue{id};

        while (!queue.empty()) {
            auto current = queue.front();
            queue.pop_front();
            auto it = childMap.find(current);
            if (it == childMap.end()) {
                continue;
            }
            for (const auto& child : it->second) {
                if (seen.insert(child).second) {
                    result.push_back(child);
                    queue.push_back(child);
                }
            }
        }
        return result;
    }

    /**
     * @brief Проверить, что candidate можно поместить под parent
     *
     * Проверяет владельца, активность родителя, отсутствие цикла
     * (обход цепочки от родителя к корню) и совпадение категории
     * с корневым предком родителя.
     *
     * @throws InvalidHierarchy при нарушении любого правила
     */
    static void validatePlacement(const Index& index, const Account& candidate, const Account& parent) {
        if (parent.ownerId != candidate.ownerId) {
            throw InvalidHierarchy("Parent " + parent.id + " belongs to another owner");
        }
        if (!parent.active) {
            throw InvalidHierarchy("Parent " + parent.id + " is inactive");
        }
        if (candidate.isRoot) {
            throw InvalidHierarchy("Root account " + candidate.name + " cannot have a parent");
        }
        if (parent.id == candidate.id || chainContains(index, parent.id, candidate.id)) {
            throw InvalidHierarchy("Placing " + candidate.name + " under " + parent.name + " creates a cycle");
        }

        const Account& root = rootAncestor(index, parent.id);
        if (root.category != candidate.category) {
            throw InvalidHierarchy("Category " + toString(candidate.category) +
                                   " does not match root ancestor category " + toString(root.category));
        }
    }

    /**
     * @brief Имя должно быть уникально среди соседей
     * @param excludeId Счёт, который переименовывают или переносят
     * @throws InvalidHierarchy при совпадении
     */
    static void validateSiblingName(
        const Index& index,
        const std::optional<std::string>& parentId,
        const std::string& name,
        const std::string& excludeId = ""
    ) {
        for (const auto& [id, account] : index) {
            if (id != excludeId && account.parentId == parentId && account.name == name) {
                throw InvalidHierarchy("Account named '" + name + "' already exists at this level");
            }
        }
    }

    /**
     * @brief Построить лес счетов владельца
     *
     * При includeInactive = false неактивные счета и их поддеревья опускаются.
     * Счета с оборванной цепочкой попадают в корни, чтобы их было видно.
     */
    static AccountTree buildTree(const std::string& ownerId,
                                 const std::vector<Account>& accounts,
                                 bool includeInactive) {
        AccountTree tree;
        tree.ownerId = ownerId;
        std::unordered_set<std::string> allIds;
        for (const auto& account : accounts) {
            allIds.insert(account.id);
            if (includeInactive || account.active) {
                tree.accounts.emplace(account.id, account);
            }
        }

        for (const auto& [id, account] : tree.accounts) {
            if (account.parentId && tree.accounts.count(*account.parentId)) {
                tree.children[*account.parentId].push_back(id);
            } else if (!account.parentId || !allIds.count(*account.parentId)) {
                tree.roots.push_back(id);
            }
        }

        auto byDisplayOrder = [&tree](const std::string& a, const std::string& b) {
            const auto& lhs = tree.accounts.at(a);
            const auto& rhs = tree.accounts.at(b);
            if (lhs.sortOrder != rhs.sortOrder) {
                return lhs.sortOrder < rhs.sortOrder;
            }
            return lhs.name < rhs.name;
        };

        std::sort(tree.roots.begin(), tree.roots.end(), byDisplayOrder);
        for (auto& [parent, kids] : tree.children) {
            std::sort(kids.begin(), kids.end(), byDisplayOrder);
        }
        return tree;
    }

    /**
     * @brief Полный путь "Income > Salary"
     */
    static std::string fullPath(const Index& index, const std::string& id) {
        std::vector<std::string> names;
        std::unordered_set<std::string> visited;
        std::optional<std::string> current = id;

        while (current && visited.insert(*current).second) {
            auto it = index.find(*current);
            if (it == index.end()) {
                break;
            }
            names.push_back(it->second.name);
            current = it->second.parentId;
        }

        std::string path;
        for (auto it = names.rbegin(); it != names.rend(); ++it) {
            if (!path.empty()) {
                path += " > ";
            }
            path += *it;
        }
        return path;
    }

    /**
     * @brief Найти все циклы в цепочках родителей
     *
     * Каждый цикл возвращается один раз, члены в порядке обхода
     * от первого встреченного узла к его родителям.
     */
    static std::vector<std::vector<std::string>> findCycles(const Index& index) {
        std::vector<std::vector<std::string>> cycles;
        std::unordered_set<std::string> done;

        std::vector<std::string> ids;
        ids.reserve(index.size());
        for (const auto& [id, account] : index) {
            ids.push_back(id);
        }
        std::sort(ids.begin(), ids.end());

        for (const auto& start : ids) {
            if (done.count(start)) {
                continue;
            }

            std::vector<std::string> path;
            std::unordered_map<std::string, size_t> position;
            std::optional<std::string> current = start;

            while (current && !done.count(*current)) {
                auto seen = position.find(*current);
                if (seen != position.end()) {
                    cycles.emplace_back(path.begin() + static_cast<std::ptrdiff_t>(seen->second), path.end());
                    break;
                }
                position[*current] = path.size();
                path.push_back(*current);

                auto it = index.find(*current);
                current = it == index.end() ? std::nullopt : it->second.parentId;
            }

            done.insert(path.begin(), path.end());
        }
        return cycles;
    }

private:
    static std::unordered_map<std::string, std::vector<std::string>> childrenIndex(const Index& index) {
        std::unordered_map<std::string, std::vector<std::string>> result;
        for (const auto& [id, account] : index) {
            if (account.parentId) {
                result[*account.parentId].push_back(id);
            }
        }
        return result;
    }
};

} // namespace budget::domain
