#pragma once

#include "enums/LoanStatus.hpp"
#include "Money.hpp"
#include "Rate.hpp"
#include "Timestamp.hpp"
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace budget::domain {

/**
 * @brief Займ между двумя счетами одного владельца
 *
 * outstanding растёт при начислении процентов и уменьшается погашениями.
 * Проценты начисляются не больше одного раза за период (accruedPeriods).
 */
struct Loan {
    std::string id;
    std::string ownerId;
    std::string lenderAccountId;
    std::string borrowerAccountId;
    Money principal;
    Rate ratePerPeriod;
    Money outstanding;
    Money totalInterest;
    LoanStatus status = LoanStatus::ACTIVE;
    std::string disbursementPeriodId;
    std::string description;
    std::set<std::string> accruedPeriods;
    Timestamp createdAt;
    std::optional<Timestamp> paidAt;

    Loan() = default;

    Loan(
        const std::string& id,
        const std::string& ownerId,
        const std::string& lenderAccountId,
        const std::string& borrowerAccountId,
        const Money& principal,
        const Rate& ratePerPeriod,
        const std::string& disbursementPeriodId
    ) : id(id), ownerId(ownerId), lenderAccountId(lenderAccountId),
        borrowerAccountId(borrowerAccountId), principal(principal),
        ratePerPeriod(ratePerPeriod), outstanding(principal),
        disbursementPeriodId(disbursementPeriodId), createdAt(Timestamp::now()) {}

    bool isActive() const { return status == LoanStatus::ACTIVE; }

    bool accruedIn(const std::string& periodId) const {
        return accruedPeriods.count(periodId) > 0;
    }
};

/**
 * @brief Платёж по займу
 */
struct LoanPayment {
    std::string id;
    std::string loanId;
    std::string periodId;
    Money amount;
    Money outstandingAfter;
    std::string notes;
    Timestamp timestamp;

    LoanPayment() = default;

    LoanPayment(
        const std::string& id,
        const std::string& loanId,
        const std::string& periodId,
        const Money& amount,
        const Money& outstandingAfter,
        const std::string& notes = ""
    ) : id(id), loanId(loanId), periodId(periodId), amount(amount),
        outstandingAfter(outstandingAfter), notes(notes), timestamp(Timestamp::now()) {}
};

/**
 * @brief Итог начисления процентов по всем займам за период
 */
struct AccrualSummary {
    std::vector<Loan> accrued;      ///< Займы, по которым начисление прошло в этом вызове
    Money totalInterest;
    std::vector<std::string> errors;
};

/**
 * @brief Итог автоматических погашений за период
 */
struct AutoRepaySummary {
    std::vector<LoanPayment> payments;
    Money totalRepaid;
    std::vector<std::string> errors;
};

/**
 * @brief Запрос на выдачу займа. Без ставки берётся ставка владельца по умолчанию.
 */
struct LoanRequest {
    std::string lenderAccountId;
    std::string borrowerAccountId;
    Money principal;
    std::optional<Rate> ratePerPeriod;
    std::string periodId;
    std::string description;
};

} // namespace budget::domain
