#pragma once

#include <string>
#include <stdexcept>

namespace budget::domain {

/**
 * @brief Как отражать начисленные проценты в журнале
 */
enum class InterestBookkeeping {
    LOAN_ONLY,              ///< Только растёт долг по займу, проводок нет
    CREDIT_LENDER,          ///< Одна проводка INTEREST_ACCRUAL в плюс кредитору
    TRANSFER_FROM_BORROWER  ///< Перевод INTEREST_ACCRUAL заёмщик → кредитор
};

inline std::string toString(InterestBookkeeping policy) {
    switch (policy) {
        case InterestBookkeeping::LOAN_ONLY:              return "LOAN_ONLY";
        case InterestBookkeeping::CREDIT_LENDER:          return "CREDIT_LENDER";
        case InterestBookkeeping::TRANSFER_FROM_BORROWER: return "TRANSFER_FROM_BORROWER";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline InterestBookkeeping interestBookkeepingFromString(const std::string& str) {
    if (str == "LOAN_ONLY")              return InterestBookkeeping::LOAN_ONLY;
    if (str == "CREDIT_LENDER")          return InterestBookkeeping::CREDIT_LENDER;
    if (str == "TRANSFER_FROM_BORROWER") return InterestBookkeeping::TRANSFER_FROM_BORROWER;
    throw std::invalid_argument("Unknown InterestBookkeeping: " + str);
}

} // namespace budget::domain
