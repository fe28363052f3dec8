#pragma once

#include "ports/output/IAccountRepository.hpp"
#include <ThreadSafeMap.hpp>
#include <algorithm>
#include <mutex>
#include <set>
#include <unordered_map>

namespace budget::adapters::secondary {

/**
 * @brief In-memory реализация репозитория счетов
 */
class InMemoryAccountRepository : public ports::output::IAccountRepository {
public:
    void save(const domain::Account& account) override {
        auto previous = accounts_.find(account.id);
        accounts_.insert(account.id, std::make_shared<domain::Account>(account));

        std::lock_guard<std::mutex> lock(indexMutex_);
        if (previous && previous->ownerId != account.ownerId) {
            ownerAccounts_[previous->ownerId].erase(account.id);
        }
        ownerAccounts_[account.ownerId].insert(account.id);
    }

    std::optional<domain::Account> findById(const std::string& id) override {
        auto account = accounts_.find(id);
        return account ? std::optional(*account) : std::nullopt;
    }

    /**
     * @brief Счета владельца в порядке создания
     */
    std::vector<domain::Account> findByOwner(const std::string& ownerId) override {
        std::set<std::string> ids;
        {
            std::lock_guard<std::mutex> lock(indexMutex_);
            auto it = ownerAccounts_.find(ownerId);
            if (it != ownerAccounts_.end()) {
                ids = it->second;
            }
        }

        std::vector<domain::Account> result;
        for (const auto& id : ids) {
            if (auto account = accounts_.find(id)) {
                result.push_back(*account);
            }
        }

        std::stable_sort(result.begin(), result.end(),
            [](const domain::Account& a, const domain::Account& b) {
                return a.createdAt < b.createdAt;
            });
        return result;
    }

    std::vector<domain::Account> findWithoutOwner() override {
        std::vector<domain::Account> result;
        for (const auto& account : accounts_.values(
                 [](const domain::Account& a) { return a.ownerId.empty(); })) {
            result.push_back(*account);
        }
        return result;
    }

    bool deleteById(const std::string& id) override {
        auto account = accounts_.find(id);
        if (!account) {
            return false;
        }

        {
            std::lock_guard<std::mutex> lock(indexMutex_);
            ownerAccounts_[account->ownerId].erase(id);
        }

        return accounts_.remove(id);
    }

    bool adjustBalance(const std::string& id, const domain::Money& delta) override {
        return accounts_.update(id, [&delta](const domain::Account& current) {
            domain::Account updated = current;
            updated.currentBalance += delta;
            return updated;
        });
    }

    bool setCachedBalance(const std::string& id, const domain::Money& balance) override {
        return accounts_.update(id, [&balance](const domain::Account& current) {
            domain::Account updated = current;
            updated.currentBalance = balance;
            return updated;
        });
    }

    void appendEvent(const domain::AccountEvent& event) override {
        std::lock_guard<std::mutex> lock(eventsMutex_);
        events_[event.accountId].push_back(event);
    }

    std::vector<domain::AccountEvent> findEvents(const std::string& accountId) override {
        std::lock_guard<std::mutex> lock(eventsMutex_);
        auto it = events_.find(accountId);
        return it != events_.end() ? it->second : std::vector<domain::AccountEvent>{};
    }

    size_t count() const {
        return accounts_.size();
    }

private:
    ThreadSafeMap<std::string, domain::Account> accounts_;

    mutable std::mutex indexMutex_;
    std::unordered_map<std::string, std::set<std::string>> ownerAccounts_;  // ownerId -> accountIds

    mutable std::mutex eventsMutex_;
    std::unordered_map<std::string, std::vector<domain::AccountEvent>> events_;  // accountId -> события
};

} // namespace budget::adapters::secondary
