#pragma once

#include "ports/input/ILedgerService.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "ports/output/ITransactionRepository.hpp"
#include "application/LedgerPosting.hpp"
#include "domain/AccountHierarchy.hpp"
#include <OwnerLockRegistry.hpp>
#include <algorithm>
#include <iostream>
#include <memory>

namespace budget::application {

/**
 * @brief Журнал проводок владельца
 *
 * Команды выполняются через LedgerPosting под эксклюзивной блокировкой
 * владельца, запросы читают под разделяемой.
 */
class LedgerService : public ports::input::ILedgerService {
public:
    LedgerService(
        std::shared_ptr<LedgerPosting> posting,
        std::shared_ptr<ports::output::IAccountRepository> accountRepository,
        std::shared_ptr<ports::output::ITransactionRepository> transactionRepository,
        std::shared_ptr<OwnerLockRegistry> locks
    ) : posting_(std::move(posting))
      , accountRepository_(std::move(accountRepository))
      , transactionRepository_(std::move(transactionRepository))
      , locks_(std::move(locks))
    {
        std::cout << "[LedgerService] Created" << std::endl;
    }

    domain::Transaction post(const std::string& ownerId, const domain::PostingRequest& request) override {
        auto lock = locks_->lockExclusive(ownerId);

        auto transaction = posting_->post(ownerId, request);
        std::cout << "[LedgerService] Posted " << domain::toString(transaction.kind) << " "
                  << transaction.amount.toString() << " to account " << transaction.accountId << std::endl;
        return transaction;
    }

    domain::TransferLegs postTransfer(const std::string& ownerId, const domain::TransferRequest& request) override {
        auto lock = locks_->lockExclusive(ownerId);

        auto legs = posting_->transfer(ownerId, request);
        std::cout << "[LedgerService] Posted transfer " << *legs.debit.transferId << " "
                  << request.amount.toString() << " " << request.sourceAccountId
                  << " -> " << request.destinationAccountId << std::endl;
        return legs;
    }

    std::vector<domain::Transaction> reverse(
        const std::string& ownerId,
        const std::string& transactionId,
        const std::string& periodId,
        const std::string& description
    ) override {
        auto lock = locks_->lockExclusive(ownerId);

        auto reversals = posting_->reverse(ownerId, transactionId, periodId, description);
        std::cout << "[LedgerService] Reversed transaction " << transactionId
                  << " with " << reversals.size() << " entr" << (reversals.size() == 1 ? "y" : "ies") << std::endl;
        return reversals;
    }

    Sequence<domain::Transaction> history(
        const std::string& ownerId,
        const std::string& accountId,
        const std::optional<domain::PeriodRange>& range
    ) override {
        std::vector<domain::Transaction> snapshot;
        {
            auto lock = locks_->lockShared(ownerId);
            posting_->requireAccount(ownerId, accountId);
            snapshot = transactionRepository_->findByAccount(accountId);
        }

        if (range) {
            snapshot.erase(std::remove_if(snapshot.begin(), snapshot.end(),
                [&range](const domain::Transaction& t) { return !range->includes(t.periodStart); }),
                snapshot.end());
        }

        std::sort(snapshot.begin(), snapshot.end(), [](const domain::Transaction& a, const domain::Transaction& b) {
            if (a.timestamp != b.timestamp) {
                return a.timestamp > b.timestamp;
            }
            return a.sequence > b.sequence;
        });

        return Sequence<domain::Transaction>::fromSnapshot(
            std::make_shared<const std::vector<domain::Transaction>>(std::move(snapshot)));
    }

    std::optional<domain::Transaction> getTransaction(
        const std::string& ownerId, const std::string& transactionId) override {
        auto lock = locks_->lockShared(ownerId);

        auto transaction = transactionRepository_->findById(transactionId);
        if (!transaction || transaction->ownerId != ownerId) {
            return std::nullopt;
        }
        return transaction;
    }

    domain::Money getBalance(
        const std::string& ownerId,
        const std::string& accountId,
        const std::optional<std::string>& asOfPeriodId
    ) override {
        auto lock = locks_->lockShared(ownerId);

        posting_->requireAccount(ownerId, accountId);
        if (!asOfPeriodId) {
            return posting_->fold(accountId);
        }
        auto period = posting_->requirePeriod(ownerId, *asOfPeriodId);
        return posting_->fold(accountId, period.startDate);
    }

    domain::Money getCachedBalance(const std::string& ownerId, const std::string& accountId) override {
        auto lock = locks_->lockShared(ownerId);
        return posting_->requireAccount(ownerId, accountId).currentBalance;
    }

    domain::Money getBalanceWithDescendants(const std::string& ownerId, const std::string& accountId) override {
        auto lock = locks_->lockShared(ownerId);

        auto index = domain::AccountHierarchy::index(accountRepository_->findByOwner(ownerId));
        auto it = index.find(accountId);
        if (it == index.end()) {
            throw domain::UnknownAccount(accountId);
        }

        domain::Money total = it->second.currentBalance;
        for (const auto& id : domain::AccountHierarchy::descendants(index, accountId)) {
            total += index.at(id).currentBalance;
        }
        return total;
    }

    int recomputeBalances(const std::string& ownerId) override {
        auto lock = locks_->lockExclusive(ownerId);

        int fixed = 0;
        for (const auto& account : accountRepository_->findByOwner(ownerId)) {
            auto folded = posting_->fold(account.id);
            if (folded != account.currentBalance && accountRepository_->setCachedBalance(account.id, folded)) {
                std::cout << "[LedgerService] Balance of '" << account.name << "' resynced "
                          << account.currentBalance.toString() << " -> " << folded.toString() << std::endl;
                ++fixed;
            }
        }
        return fixed;
    }

private:
    std::shared_ptr<LedgerPosting> posting_;
    std::shared_ptr<ports::output::IAccountRepository> accountRepository_;
    std::shared_ptr<ports::output::ITransactionRepository> transactionRepository_;
    std::shared_ptr<OwnerLockRegistry> locks_;
};

} // namespace budget::application
