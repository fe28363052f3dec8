#pragma once

#include "ports/output/IAccountRepository.hpp"
#include "ports/output/IPeriodRepository.hpp"
#include "ports/output/ITransactionRepository.hpp"
#include "domain/LedgerError.hpp"
#include "domain/PostingRequest.hpp"
#include "utils/UuidGenerator.hpp"
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <vector>

namespace budget::application {

/**
 * @brief Примитивы проводок
 *
 * Единственное место, где меняются балансы. Все ноги операции
 * проверяются до записи, затем записываются одним append и только
 * после этого обновляется кэш балансов.
 *
 * Запись, которая ссылается на проводки (распределение, займ, платёж),
 * сохраняется через RecordHook между append и обновлением кэша. Если
 * hook бросил исключение, проводки откатываются и балансы не меняются.
 *
 * @note Блокировок не берёт: вызывающий сервис уже держит
 *       эксклюзивную блокировку владельца.
 */
class LedgerPosting {
public:
    using RecordHook = std::function<void(const std::vector<domain::Transaction>&)>;

    LedgerPosting(
        std::shared_ptr<ports::output::IAccountRepository> accounts,
        std::shared_ptr<ports::output::IPeriodRepository> periods,
        std::shared_ptr<ports::output::ITransactionRepository> transactions
    ) : accounts_(std::move(accounts))
      , periods_(std::move(periods))
      , transactions_(std::move(transactions))
    {}

    /**
     * @throws UnknownAccount если счёт не найден или принадлежит другому владельцу
     */
    domain::Account requireAccount(const std::string& ownerId, const std::string& accountId) {
        auto account = accounts_->findById(accountId);
        if (!account || account->ownerId != ownerId) {
            throw domain::UnknownAccount(accountId);
        }
        return *account;
    }

    /**
     * @throws UnknownPeriod
     */
    domain::WeeklyPeriod requirePeriod(const std::string& ownerId, const std::string& periodId) {
        auto period = periods_->findById(periodId);
        if (!period || period->ownerId != ownerId) {
            throw domain::UnknownPeriod(periodId);
        }
        return *period;
    }

    domain::Transaction post(const std::string& ownerId, const domain::PostingRequest& request,
                             const RecordHook& record = nullptr) {
        if (request.amount.isZero()) {
            throw domain::InvalidAmount("Transaction amount must not be zero");
        }

        auto account = requireActiveAccount(ownerId, request.accountId);
        auto period = requirePeriod(ownerId, request.periodId);

        domain::Transaction transaction(
            utils::UuidGenerator::generate(), ownerId, account.id, period.id,
            period.startDate, request.amount, request.kind, request.description);

        return commit({transaction}, record).front();
    }

    domain::TransferLegs transfer(const std::string& ownerId, const domain::TransferRequest& request,
                                  const RecordHook& record = nullptr) {
        if (request.sourceAccountId == request.destinationAccountId) {
            throw domain::SameAccount(request.sourceAccountId);
        }
        if (!request.amount.isPositive()) {
            throw domain::InvalidAmount("Transfer amount must be positive");
        }

        auto source = requireActiveAccount(ownerId, request.sourceAccountId);
        auto destination = requireActiveAccount(ownerId, request.destinationAccountId);
        auto period = requirePeriod(ownerId, request.periodId);

        std::string transferId = utils::UuidGenerator::generateWithPrefix("xfer");

        domain::Transaction debit(
            utils::UuidGenerator::generate(), ownerId, source.id, period.id,
            period.startDate, -request.amount, request.kind, request.description);
        debit.transferId = transferId;

        domain::Transaction credit(
            utils::UuidGenerator::generate(), ownerId, destination.id, period.id,
            period.startDate, request.amount, request.kind, request.description);
        credit.transferId = transferId;
        credit.timestamp = debit.timestamp;

        auto stored = commit({debit, credit}, record);
        return domain::TransferLegs{stored[0], stored[1]};
    }

    /**
     * @brief Сторнирующие проводки; для ноги перевода сторнируются обе ноги
     *
     * Неактивность счёта не мешает сторно.
     */
    std::vector<domain::Transaction> reverse(
        const std::string& ownerId,
        const std::string& transactionId,
        const std::string& periodId,
        const std::string& description,
        const RecordHook& record = nullptr
    ) {
        auto original = transactions_->findById(transactionId);
        if (!original || original->ownerId != ownerId) {
            throw domain::UnknownTransaction(transactionId);
        }
        if (original->isReversal()) {
            throw domain::InvalidState("Transaction " + transactionId + " is itself a reversal");
        }

        std::vector<domain::Transaction> legs = original->transferId
            ? transactions_->findByTransferId(*original->transferId)
            : std::vector<domain::Transaction>{*original};

        for (const auto& leg : legs) {
            if (!transactions_->findReversalsOf(leg.id).empty()) {
                throw domain::InvalidState("Transaction " + leg.id + " is already reversed");
            }
            requireAccount(ownerId, leg.accountId);
        }
        auto period = requirePeriod(ownerId, periodId);

        std::optional<std::string> transferId;
        if (original->transferId) {
            transferId = utils::UuidGenerator::generateWithPrefix("xfer");
        }

        std::vector<domain::Transaction> reversals;
        for (const auto& leg : legs) {
            domain::Transaction reversal(
                utils::UuidGenerator::generate(), ownerId, leg.accountId, period.id,
                period.startDate, -leg.amount, leg.kind,
                description.empty() ? "Reversal of " + leg.id : description);
            reversal.transferId = transferId;
            reversal.reversesId = leg.id;
            reversals.push_back(reversal);
        }

        return commit(reversals, record);
    }

    /**
     * @brief Свёртка журнала по счёту
     *
     * @param upToPeriodStart Учитывать периоды с началом не позже этой даты
     */
    domain::Money fold(const std::string& accountId,
                       const std::optional<domain::Date>& upToPeriodStart = std::nullopt) {
        domain::Money sum;
        for (const auto& transaction : transactions_->findByAccount(accountId)) {
            if (!upToPeriodStart || transaction.periodStart <= *upToPeriodStart) {
                sum += transaction.amount;
            }
        }
        return sum;
    }

private:
    std::shared_ptr<ports::output::IAccountRepository> accounts_;
    std::shared_ptr<ports::output::IPeriodRepository> periods_;
    std::shared_ptr<ports::output::ITransactionRepository> transactions_;

    domain::Account requireActiveAccount(const std::string& ownerId, const std::string& accountId) {
        auto account = requireAccount(ownerId, accountId);
        if (!account.active) {
            throw domain::InvalidState("Account " + account.name + " is inactive");
        }
        return account;
    }

    std::vector<domain::Transaction> commit(const std::vector<domain::Transaction>& legs,
                                            const RecordHook& record = nullptr) {
        auto stored = transactions_->append(legs);

        if (record) {
            try {
                record(stored);
            } catch (...) {
                rollback(stored);
                throw;
            }
        }

        for (const auto& transaction : stored) {
            if (!accounts_->adjustBalance(transaction.accountId, transaction.amount)) {
                std::cerr << "[LedgerPosting] Balance cache not updated for account "
                          << transaction.accountId << ", recompute required" << std::endl;
            }
        }

        std::cout << "[LedgerPosting] Committed " << stored.size() << " leg(s)";
        if (!stored.empty()) {
            std::cout << ", first #" << stored.front().sequence
                      << " " << domain::toString(stored.front().kind)
                      << " " << stored.front().amount.toString();
        }
        std::cout << std::endl;
        return stored;
    }

    void rollback(const std::vector<domain::Transaction>& stored) {
        std::vector<std::string> ids;
        for (const auto& transaction : stored) {
            ids.push_back(transaction.id);
        }
        try {
            transactions_->discard(ids);
            std::cerr << "[LedgerPosting] Record not saved, discarded " << ids.size() << " leg(s)" << std::endl;
        } catch (const std::exception& e) {
            // Наружу уходит исходная ошибка; расхождение с кэшем балансов найдёт IntegrityService
            std::cerr << "[LedgerPosting] Rollback failed, journal needs integrity check: "
                      << e.what() << std::endl;
        }
    }
};

} // namespace budget::application
