#pragma once

#include "ports/output/IPeriodRepository.hpp"
#include <ThreadSafeMap.hpp>
#include <iterator>
#include <map>
#include <mutex>
#include <unordered_map>

namespace budget::adapters::secondary {

/**
 * @brief In-memory реализация репозитория периодов
 *
 * Для каждого владельца держит упорядоченный по дате начала индекс.
 */
class InMemoryPeriodRepository : public ports::output::IPeriodRepository {
public:
    void saveAll(const std::vector<domain::WeeklyPeriod>& periods) override {
        std::vector<std::pair<std::string, std::shared_ptr<domain::WeeklyPeriod>>> entries;
        entries.reserve(periods.size());
        for (const auto& period : periods) {
            entries.emplace_back(period.id, std::make_shared<domain::WeeklyPeriod>(period));
        }

        std::lock_guard<std::mutex> lock(indexMutex_);
        periods_.insertAll(entries);
        for (const auto& period : periods) {
            byStart_[period.ownerId][period.startDate] = period.id;
        }
    }

    std::optional<domain::WeeklyPeriod> findById(const std::string& id) override {
        auto period = periods_.find(id);
        return period ? std::optional(*period) : std::nullopt;
    }

    std::vector<domain::WeeklyPeriod> findByOwner(const std::string& ownerId) override {
        std::vector<std::string> ids;
        {
            std::lock_guard<std::mutex> lock(indexMutex_);
            auto it = byStart_.find(ownerId);
            if (it != byStart_.end()) {
                for (const auto& entry : it->second) {
                    ids.push_back(entry.second);
                }
            }
        }

        std::vector<domain::WeeklyPeriod> result;
        for (const auto& id : ids) {
            if (auto period = periods_.find(id)) {
                result.push_back(*period);
            }
        }
        return result;
    }

    std::optional<domain::WeeklyPeriod> findContaining(
        const std::string& ownerId, const domain::Date& date) override
    {
        std::string id;
        {
            std::lock_guard<std::mutex> lock(indexMutex_);
            auto owner = byStart_.find(ownerId);
            if (owner == byStart_.end()) {
                return std::nullopt;
            }
            // Последний период, начавшийся не позже даты
            auto it = owner->second.upper_bound(date);
            if (it == owner->second.begin()) {
                return std::nullopt;
            }
            id = std::prev(it)->second;
        }

        auto period = findById(id);
        if (period && period->contains(date)) {
            return period;
        }
        return std::nullopt;
    }

    std::optional<domain::WeeklyPeriod> findByStart(
        const std::string& ownerId, const domain::Date& startDate) override
    {
        std::string id;
        {
            std::lock_guard<std::mutex> lock(indexMutex_);
            auto owner = byStart_.find(ownerId);
            if (owner == byStart_.end()) {
                return std::nullopt;
            }
            auto it = owner->second.find(startDate);
            if (it == owner->second.end()) {
                return std::nullopt;
            }
            id = it->second;
        }
        return findById(id);
    }

    std::optional<domain::WeeklyPeriod> findEarliest(const std::string& ownerId) override {
        return findEdge(ownerId, true);
    }

    std::optional<domain::WeeklyPeriod> findLatest(const std::string& ownerId) override {
        return findEdge(ownerId, false);
    }

private:
    ThreadSafeMap<std::string, domain::WeeklyPeriod> periods_;

    mutable std::mutex indexMutex_;
    std::unordered_map<std::string, std::map<domain::Date, std::string>> byStart_;  // ownerId -> startDate -> periodId

    std::optional<domain::WeeklyPeriod> findEdge(const std::string& ownerId, bool earliest) {
        std::string id;
        {
            std::lock_guard<std::mutex> lock(indexMutex_);
            auto owner = byStart_.find(ownerId);
            if (owner == byStart_.end() || owner->second.empty()) {
                return std::nullopt;
            }
            id = earliest ? owner->second.begin()->second : owner->second.rbegin()->second;
        }
        return findById(id);
    }
};

} // namespace budget::adapters::secondary
