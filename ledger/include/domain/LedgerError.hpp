#pragma once

#include <stdexcept>
#include <string>

namespace budget::domain {

/**
 * @brief Вид ошибки ledger
 */
enum class ErrorKind {
    INVALID_HIERARCHY,  ///< Цикл, чужой или неактивный родитель, несовпадение категорий
    INVALID_AMOUNT,     ///< Нулевая или отрицательная сумма там, где запрещено
    SAME_ACCOUNT,       ///< Источник совпадает с получателем
    UNKNOWN_ACCOUNT,
    INVALID_POOL,       ///< Пул распределения <= 0
    OVERPAYMENT,        ///< Погашение больше остатка долга или займ уже погашен
    PERIOD_GAP,         ///< Нельзя построить непрерывную цепочку периодов
    UNKNOWN_PERIOD,
    UNKNOWN_TEMPLATE,
    UNKNOWN_LOAN,
    UNKNOWN_TRANSACTION,
    INVALID_ARGUMENT,
    INVALID_STATE       ///< Операция недопустима в текущем состоянии объекта
};

inline std::string toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INVALID_HIERARCHY: return "InvalidHierarchy";
        case ErrorKind::INVALID_AMOUNT:    return "InvalidAmount";
        case ErrorKind::SAME_ACCOUNT:      return "SameAccount";
        case ErrorKind::UNKNOWN_ACCOUNT:   return "UnknownAccount";
        case ErrorKind::INVALID_POOL:      return "InvalidPool";
        case ErrorKind::OVERPAYMENT:       return "OverpaymentError";
        case ErrorKind::PERIOD_GAP:        return "PeriodGapError";
        case ErrorKind::UNKNOWN_PERIOD:    return "UnknownPeriod";
        case ErrorKind::UNKNOWN_TEMPLATE:  return "UnknownTemplate";
        case ErrorKind::UNKNOWN_LOAN:      return "UnknownLoan";
        case ErrorKind::UNKNOWN_TRANSACTION: return "UnknownTransaction";
        case ErrorKind::INVALID_ARGUMENT:  return "InvalidArgument";
        case ErrorKind::INVALID_STATE:     return "InvalidState";
    }
    return "Unknown";
}

/**
 * @brief Базовое исключение ledger
 *
 * Все ошибки операций бросаются наследниками этого класса.
 * Ошибка отменяет только ту операцию, в которой возникла.
 */
class LedgerException : public std::runtime_error {
public:
    LedgerException(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class InvalidHierarchy : public LedgerException {
public:
    explicit InvalidHierarchy(const std::string& message)
        : LedgerException(ErrorKind::INVALID_HIERARCHY, message) {}
};

class InvalidAmount : public LedgerException {
public:
    explicit InvalidAmount(const std::string& message)
        : LedgerException(ErrorKind::INVALID_AMOUNT, message) {}
};

class SameAccount : public LedgerException {
public:
    explicit SameAccount(const std::string& accountId)
        : LedgerException(ErrorKind::SAME_ACCOUNT,
                          "Source and destination are the same account: " + accountId) {}
};

class UnknownAccount : public LedgerException {
public:
    explicit UnknownAccount(const std::string& accountId)
        : LedgerException(ErrorKind::UNKNOWN_ACCOUNT, "Unknown account: " + accountId) {}
};

class InvalidPool : public LedgerException {
public:
    explicit InvalidPool(const std::string& message)
        : LedgerException(ErrorKind::INVALID_POOL, message) {}
};

class OverpaymentError : public LedgerException {
public:
    explicit OverpaymentError(const std::string& message)
        : LedgerException(ErrorKind::OVERPAYMENT, message) {}
};

class PeriodGapError : public LedgerException {
public:
    explicit PeriodGapError(const std::string& message)
        : LedgerException(ErrorKind::PERIOD_GAP, message) {}
};

class UnknownPeriod : public LedgerException {
public:
    explicit UnknownPeriod(const std::string& periodId)
        : LedgerException(ErrorKind::UNKNOWN_PERIOD, "Unknown period: " + periodId) {}
};

class UnknownTemplate : public LedgerException {
public:
    explicit UnknownTemplate(const std::string& templateId)
        : LedgerException(ErrorKind::UNKNOWN_TEMPLATE, "Unknown template: " + templateId) {}
};

class UnknownLoan : public LedgerException {
public:
    explicit UnknownLoan(const std::string& loanId)
        : LedgerException(ErrorKind::UNKNOWN_LOAN, "Unknown loan: " + loanId) {}
};

class UnknownTransaction : public LedgerException {
public:
    explicit UnknownTransaction(const std::string& transactionId)
        : LedgerException(ErrorKind::UNKNOWN_TRANSACTION, "Unknown transaction: " + transactionId) {}
};

class InvalidArgument : public LedgerException {
public:
    explicit InvalidArgument(const std::string& message)
        : LedgerException(ErrorKind::INVALID_ARGUMENT, message) {}
};

class InvalidState : public LedgerException {
public:
    explicit InvalidState(const std::string& message)
        : LedgerException(ErrorKind::INVALID_STATE, message) {}
};

} // namespace budget::domain
