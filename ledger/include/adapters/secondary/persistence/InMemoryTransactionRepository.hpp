#pragma once

#include "ports/output/ITransactionRepository.hpp"
#include <ThreadSafeMap.hpp>
#include <algorithm>
#include <mutex>
#include <unordered_map>

namespace budget::adapters::secondary {

/**
 * @brief In-memory журнал проводок
 *
 * Номер в журнале и индексы меняются под одним мьютексом вместе со
 * вставкой пачки, поэтому читатель видит либо все ноги операции,
 * либо ни одной.
 */
class InMemoryTransactionRepository : public ports::output::ITransactionRepository {
public:
    std::vector<domain::Transaction> append(const std::vector<domain::Transaction>& transactions) override {
        std::lock_guard<std::mutex> lock(indexMutex_);

        std::vector<domain::Transaction> stored;
        std::vector<std::pair<std::string, std::shared_ptr<domain::Transaction>>> entries;
        stored.reserve(transactions.size());
        entries.reserve(transactions.size());

        int64_t sequence = nextSequence_;
        for (const auto& transaction : transactions) {
            domain::Transaction copy = transaction;
            copy.sequence = ++sequence;
            stored.push_back(copy);
            entries.emplace_back(copy.id, std::make_shared<domain::Transaction>(copy));
        }

        transactions_.insertAll(entries);
        nextSequence_ = sequence;

        for (const auto& transaction : stored) {
            accountTransactions_[transaction.accountId].push_back(transaction.id);
            ownerTransactions_[transaction.ownerId].push_back(transaction.id);
            if (transaction.transferId) {
                transferLegs_[*transaction.transferId].push_back(transaction.id);
            }
            if (transaction.reversesId) {
                reversals_[*transaction.reversesId].push_back(transaction.id);
            }
        }

        return stored;
    }

    void discard(const std::vector<std::string>& transactionIds) override {
        std::lock_guard<std::mutex> lock(indexMutex_);

        for (const auto& id : transactionIds) {
            auto transaction = transactions_.find(id);
            if (!transaction) {
                continue;
            }
            unindex(accountTransactions_, transaction->accountId, id);
            unindex(ownerTransactions_, transaction->ownerId, id);
            if (transaction->transferId) {
                unindex(transferLegs_, *transaction->transferId, id);
            }
            if (transaction->reversesId) {
                unindex(reversals_, *transaction->reversesId, id);
            }
            transactions_.remove(id);
        }
    }

    std::optional<domain::Transaction> findById(const std::string& id) override {
        auto transaction = transactions_.find(id);
        return transaction ? std::optional(*transaction) : std::nullopt;
    }

    std::vector<domain::Transaction> findByAccount(const std::string& accountId) override {
        return collect(accountTransactions_, accountId);
    }

    std::vector<domain::Transaction> findByOwner(const std::string& ownerId) override {
        return collect(ownerTransactions_, ownerId);
    }

    std::vector<domain::Transaction> findByTransferId(const std::string& transferId) override {
        return collect(transferLegs_, transferId);
    }

    std::vector<domain::Transaction> findReversalsOf(const std::string& transactionId) override {
        return collect(reversals_, transactionId);
    }

    size_t count() const {
        return transactions_.size();
    }

private:
    using Index = std::unordered_map<std::string, std::vector<std::string>>;

    ThreadSafeMap<std::string, domain::Transaction> transactions_;

    mutable std::mutex indexMutex_;
    int64_t nextSequence_ = 0;
    Index accountTransactions_;
    Index ownerTransactions_;
    Index transferLegs_;        // transferId -> ноги перевода
    Index reversals_;           // transactionId -> сторнирующие проводки

    static void unindex(Index& index, const std::string& key, const std::string& id) {
        auto it = index.find(key);
        if (it == index.end()) {
            return;
        }
        auto& ids = it->second;
        ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
        if (ids.empty()) {
            index.erase(it);
        }
    }

    /**
     * @brief Проводки по индексу в порядке журнала
     */
    std::vector<domain::Transaction> collect(const Index& index, const std::string& key) {
        std::vector<std::string> ids;
        {
            std::lock_guard<std::mutex> lock(indexMutex_);
            auto it = index.find(key);
            if (it != index.end()) {
                ids = it->second;
            }
        }

        std::vector<domain::Transaction> result;
        result.reserve(ids.size());
        for (const auto& id : ids) {
            if (auto transaction = transactions_.find(id)) {
                result.push_back(*transaction);
            }
        }
        return result;
    }
};

} // namespace budget::adapters::secondary
