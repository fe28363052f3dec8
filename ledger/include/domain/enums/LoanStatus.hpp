#pragma once

#include <string>
#include <stdexcept>

namespace budget::domain {

/**
 * @brief Статус займа
 *
 * ACTIVE → PAID, обратного перехода нет.
 */
enum class LoanStatus {
    ACTIVE,
    PAID
};

inline std::string toString(LoanStatus status) {
    switch (status) {
        case LoanStatus::ACTIVE: return "ACTIVE";
        case LoanStatus::PAID:   return "PAID";
    }
    return "UNKNOWN";
}

inline LoanStatus loanStatusFromString(const std::string& str) {
    if (str == "ACTIVE") return LoanStatus::ACTIVE;
    if (str == "PAID")   return LoanStatus::PAID;
    throw std::invalid_argument("Unknown LoanStatus: " + str);
}

inline bool isTerminal(LoanStatus status) {
    return status == LoanStatus::PAID;
}

} // namespace budget::domain
