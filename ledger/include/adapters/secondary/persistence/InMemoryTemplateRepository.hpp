#pragma once

#include "ports/output/ITemplateRepository.hpp"
#include <ThreadSafeMap.hpp>
#include <algorithm>
#include <mutex>
#include <set>
#include <unordered_map>

namespace budget::adapters::secondary {

/**
 * @brief In-memory реализация репозитория шаблонов
 */
class InMemoryTemplateRepository : public ports::output::ITemplateRepository {
public:
    domain::BudgetTemplate add(const domain::BudgetTemplate& budgetTemplate) override {
        std::lock_guard<std::mutex> lock(indexMutex_);

        domain::BudgetTemplate stored = budgetTemplate;
        stored.creationOrder = ++nextCreationOrder_;

        templates_.insert(stored.id, std::make_shared<domain::BudgetTemplate>(stored));
        ownerTemplates_[stored.ownerId].insert(stored.id);
        return stored;
    }

    bool update(const domain::BudgetTemplate& budgetTemplate) override {
        return templates_.update(budgetTemplate.id, [&budgetTemplate](const domain::BudgetTemplate& current) {
            domain::BudgetTemplate updated = budgetTemplate;
            updated.creationOrder = current.creationOrder;
            return updated;
        });
    }

    std::optional<domain::BudgetTemplate> findById(const std::string& id) override {
        auto found = templates_.find(id);
        return found ? std::optional(*found) : std::nullopt;
    }

    /**
     * @brief Шаблоны владельца в порядке создания
     */
    std::vector<domain::BudgetTemplate> findByOwner(const std::string& ownerId) override {
        std::set<std::string> ids;
        {
            std::lock_guard<std::mutex> lock(indexMutex_);
            auto it = ownerTemplates_.find(ownerId);
            if (it != ownerTemplates_.end()) {
                ids = it->second;
            }
        }

        std::vector<domain::BudgetTemplate> result;
        for (const auto& id : ids) {
            if (auto found = templates_.find(id)) {
                result.push_back(*found);
            }
        }

        std::sort(result.begin(), result.end(),
            [](const domain::BudgetTemplate& a, const domain::BudgetTemplate& b) {
                return a.creationOrder < b.creationOrder;
            });
        return result;
    }

    bool deleteById(const std::string& id) override {
        auto found = templates_.find(id);
        if (!found) {
            return false;
        }

        {
            std::lock_guard<std::mutex> lock(indexMutex_);
            ownerTemplates_[found->ownerId].erase(id);
        }

        return templates_.remove(id);
    }

private:
    ThreadSafeMap<std::string, domain::BudgetTemplate> templates_;

    mutable std::mutex indexMutex_;
    int64_t nextCreationOrder_ = 0;
    std::unordered_map<std::string, std::set<std::string>> ownerTemplates_;  // ownerId -> templateIds
};

} // namespace budget::adapters::secondary
