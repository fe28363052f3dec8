#pragma once

#include <string>
#include <stdexcept>

namespace budget::domain {

/**
 * @brief Вид проводки
 */
enum class TransactionKind {
    INCOME,
    EXPENSE,
    TRANSFER,
    LOAN_DISBURSEMENT,
    LOAN_REPAYMENT,
    INTEREST_ACCRUAL
};

inline std::string toString(TransactionKind kind) {
    switch (kind) {
        case TransactionKind::INCOME:            return "INCOME";
        case TransactionKind::EXPENSE:           return "EXPENSE";
        case TransactionKind::TRANSFER:          return "TRANSFER";
        case TransactionKind::LOAN_DISBURSEMENT: return "LOAN_DISBURSEMENT";
        case TransactionKind::LOAN_REPAYMENT:    return "LOAN_REPAYMENT";
        case TransactionKind::INTEREST_ACCRUAL:  return "INTEREST_ACCRUAL";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline TransactionKind transactionKindFromString(const std::string& str) {
    if (str == "INCOME")            return TransactionKind::INCOME;
    if (str == "EXPENSE")           return TransactionKind::EXPENSE;
    if (str == "TRANSFER")          return TransactionKind::TRANSFER;
    if (str == "LOAN_DISBURSEMENT") return TransactionKind::LOAN_DISBURSEMENT;
    if (str == "LOAN_REPAYMENT")    return TransactionKind::LOAN_REPAYMENT;
    if (str == "INTEREST_ACCRUAL")  return TransactionKind::INTEREST_ACCRUAL;
    throw std::invalid_argument("Unknown TransactionKind: " + str);
}

/**
 * @brief Проводки этого вида формируют пул распределения (доходы минус расходы)
 */
inline bool countsTowardPool(TransactionKind kind) {
    return kind == TransactionKind::INCOME || kind == TransactionKind::EXPENSE;
}

} // namespace budget::domain
