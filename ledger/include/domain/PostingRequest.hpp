#pragma once

#include "enums/TransactionKind.hpp"
#include "Money.hpp"
#include <string>

namespace budget::domain {

/**
 * @brief Запрос на одну проводку
 */
struct PostingRequest {
    std::string accountId;
    std::string periodId;
    Money amount;
    TransactionKind kind = TransactionKind::INCOME;
    std::string description;
};

/**
 * @brief Запрос на перевод: дебет source, кредит destination
 */
struct TransferRequest {
    std::string sourceAccountId;
    std::string destinationAccountId;
    std::string periodId;
    Money amount;
    TransactionKind kind = TransactionKind::TRANSFER;
    std::string description;
};

} // namespace budget::domain
