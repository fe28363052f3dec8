#pragma once

#include "enums/TransactionKind.hpp"
#include "Date.hpp"
#include "Money.hpp"
#include "Timestamp.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace budget::domain {

/**
 * @brief Проводка журнала
 *
 * Неизменяемая запись: исправления делаются сторнирующими проводками.
 * Положительная сумма - кредит (баланс растёт), отрицательная - дебет.
 * Две ноги перевода связаны общим transferId.
 */
struct Transaction {
    std::string id;
    std::string ownerId;
    std::string accountId;
    std::string periodId;
    Date periodStart;                       ///< Для выборок по диапазону периодов
    Money amount;                           ///< Никогда не ноль
    TransactionKind kind = TransactionKind::INCOME;
    std::string description;
    Timestamp timestamp;
    int64_t sequence = 0;                   ///< Порядковый номер в журнале, назначает репозиторий
    std::optional<std::string> transferId;
    std::optional<std::string> reversesId;  ///< Проводка, которую сторнирует эта

    Transaction() = default;

    Transaction(
        const std::string& id,
        const std::string& ownerId,
        const std::string& accountId,
        const std::string& periodId,
        const Date& periodStart,
        const Money& amount,
        TransactionKind kind,
        const std::string& description
    ) : id(id), ownerId(ownerId), accountId(accountId), periodId(periodId),
        periodStart(periodStart), amount(amount), kind(kind),
        description(description), timestamp(Timestamp::now()) {}

    bool isCredit() const { return amount.isPositive(); }
    bool isTransferLeg() const { return transferId.has_value(); }
    bool isReversal() const { return reversesId.has_value(); }
};

/**
 * @brief Обе ноги перевода
 */
struct TransferLegs {
    Transaction debit;
    Transaction credit;
};

} // namespace budget::domain
