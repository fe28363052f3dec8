#pragma once

#include "ports/output/IAllocationRepository.hpp"
#include <ThreadSafeMap.hpp>
#include <mutex>
#include <unordered_map>

namespace budget::adapters::secondary {

/**
 * @brief In-memory реализация репозитория распределений
 */
class InMemoryAllocationRepository : public ports::output::IAllocationRepository {
public:
    void save(const domain::Allocation& allocation) override {
        bool existed = allocations_.contains(allocation.id);
        allocations_.insert(allocation.id, std::make_shared<domain::Allocation>(allocation));

        if (!existed) {
            std::lock_guard<std::mutex> lock(indexMutex_);
            ownerAllocations_[allocation.ownerId].push_back(allocation.id);
        }
    }

    std::optional<domain::Allocation> findById(const std::string& id) override {
        auto allocation = allocations_.find(id);
        return allocation ? std::optional(*allocation) : std::nullopt;
    }

    std::vector<domain::Allocation> findByPeriod(
        const std::string& ownerId, const std::string& periodId) override
    {
        std::vector<domain::Allocation> result;
        for (const auto& allocation : findByOwner(ownerId)) {
            if (allocation.periodId == periodId) {
                result.push_back(allocation);
            }
        }
        return result;
    }

    std::vector<domain::Allocation> findByOwner(const std::string& ownerId) override {
        std::vector<std::string> ids;
        {
            std::lock_guard<std::mutex> lock(indexMutex_);
            auto it = ownerAllocations_.find(ownerId);
            if (it != ownerAllocations_.end()) {
                ids = it->second;
            }
        }

        std::vector<domain::Allocation> result;
        for (const auto& id : ids) {
            if (auto allocation = allocations_.find(id)) {
                result.push_back(*allocation);
            }
        }
        return result;
    }

private:
    ThreadSafeMap<std::string, domain::Allocation> allocations_;

    mutable std::mutex indexMutex_;
    std::unordered_map<std::string, std::vector<std::string>> ownerAllocations_;  // ownerId -> в порядке создания
};

} // namespace budget::adapters::secondary
