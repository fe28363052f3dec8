#pragma once

#include "domain/Loan.hpp"
#include <string>
#include <optional>
#include <vector>

namespace budget::ports::output {

/**
 * @brief Интерфейс репозитория займов и платежей по ним
 */
class ILoanRepository {
public:
    virtual ~ILoanRepository() = default;

    /**
     * @brief Сохранить займ (вставка или обновление)
     */
    virtual void save(const domain::Loan& loan) = 0;

    virtual std::optional<domain::Loan> findById(const std::string& id) = 0;

    /**
     * @brief Займы владельца в порядке выдачи
     */
    virtual std::vector<domain::Loan> findByOwner(const std::string& ownerId) = 0;

    virtual void savePayment(const domain::LoanPayment& payment) = 0;

    /**
     * @brief Платежи по займу в порядке внесения
     */
    virtual std::vector<domain::LoanPayment> findPayments(const std::string& loanId) = 0;
};

} // namespace budget::ports::output
