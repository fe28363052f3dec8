#pragma once

#include "domain/Money.hpp"
#include "domain/PostingRequest.hpp"
#include "domain/Transaction.hpp"
#include "domain/WeeklyPeriod.hpp"
#include <Sequence.hpp>
#include <optional>
#include <string>
#include <vector>

namespace budget::ports::input {

/**
 * @brief Интерфейс журнала проводок
 */
class ILedgerService {
public:
    virtual ~ILedgerService() = default;

    /**
     * @brief Провести сумму по счёту
     *
     * @throws InvalidAmount сумма равна нулю
     * @throws UnknownAccount, UnknownPeriod неверные ссылки
     * @throws InvalidState счёт неактивен
     */
    virtual domain::Transaction post(const std::string& ownerId, const domain::PostingRequest& request) = 0;

    /**
     * @brief Перевод: обе ноги фиксируются вместе или ни одна
     *
     * @throws SameAccount источник совпадает с получателем
     * @throws InvalidAmount сумма <= 0
     */
    virtual domain::TransferLegs postTransfer(const std::string& ownerId, const domain::TransferRequest& request) = 0;

    /**
     * @brief Сторнировать проводку (для перевода - обе ноги)
     *
     * @throws InvalidState проводка уже сторнирована или сама является сторно
     */
    virtual std::vector<domain::Transaction> reverse(
        const std::string& ownerId,
        const std::string& transactionId,
        const std::string& periodId,
        const std::string& description
    ) = 0;

    /**
     * @brief История счёта: новые сверху, при равном времени - по номеру в журнале
     */
    virtual Sequence<domain::Transaction> history(
        const std::string& ownerId,
        const std::string& accountId,
        const std::optional<domain::PeriodRange>& range = std::nullopt
    ) = 0;

    virtual std::optional<domain::Transaction> getTransaction(
        const std::string& ownerId, const std::string& transactionId) = 0;

    /**
     * @brief Баланс свёрткой журнала до периода включительно (или за всё время)
     */
    virtual domain::Money getBalance(
        const std::string& ownerId,
        const std::string& accountId,
        const std::optional<std::string>& asOfPeriodId = std::nullopt
    ) = 0;

    /**
     * @brief Кэшированный баланс, O(1)
     */
    virtual domain::Money getCachedBalance(const std::string& ownerId, const std::string& accountId) = 0;

    /**
     * @brief Сумма балансов счёта и всех его потомков
     */
    virtual domain::Money getBalanceWithDescendants(const std::string& ownerId, const std::string& accountId) = 0;

    /**
     * @brief Пересчитать кэши балансов по журналу
     *
     * @return Число исправленных счетов
     */
    virtual int recomputeBalances(const std::string& ownerId) = 0;
};

} // namespace budget::ports::input
