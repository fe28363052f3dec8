#pragma once

#include "domain/Loan.hpp"
#include "domain/Money.hpp"
#include <optional>
#include <string>
#include <vector>

namespace budget::ports::input {

/**
 * @brief Интерфейс подсистемы займов
 */
class ILoanService {
public:
    virtual ~ILoanService() = default;

    /**
     * @brief Выдать займ: перевод кредитор → заёмщик
     *
     * @throws InvalidAmount principal <= 0 или ставка < 0
     * @throws SameAccount кредитор совпадает с заёмщиком
     */
    virtual domain::Loan disburse(const std::string& ownerId, const domain::LoanRequest& request) = 0;

    /**
     * @brief Начислить проценты за период
     *
     * Для погашенного займа и уже начисленного периода ничего не делает.
     */
    virtual domain::Loan accrueInterest(
        const std::string& ownerId, const std::string& loanId, const std::string& periodId) = 0;

    /**
     * @brief Начислить проценты по всем активным займам владельца
     */
    virtual domain::AccrualSummary accrueAll(const std::string& ownerId, const std::string& periodId) = 0;

    /**
     * @brief Погасить часть долга: перевод заёмщик → кредитор
     *
     * @throws InvalidAmount amount <= 0
     * @throws OverpaymentError amount больше остатка или займ уже погашен
     */
    virtual domain::LoanPayment repay(
        const std::string& ownerId,
        const std::string& loanId,
        const domain::Money& amount,
        const std::string& periodId,
        const std::string& notes = ""
    ) = 0;

    /**
     * @brief Автопогашения по настройкам владельца
     */
    virtual domain::AutoRepaySummary autoRepay(const std::string& ownerId, const std::string& periodId) = 0;

    virtual std::optional<domain::Loan> getLoan(const std::string& ownerId, const std::string& loanId) = 0;

    virtual std::vector<domain::Loan> listLoans(const std::string& ownerId, bool activeOnly) = 0;

    virtual std::vector<domain::LoanPayment> getPayments(const std::string& ownerId, const std::string& loanId) = 0;
};

} // namespace budget::ports::input
