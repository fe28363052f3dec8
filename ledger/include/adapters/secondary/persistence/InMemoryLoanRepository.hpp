#pragma once

#include "ports/output/ILoanRepository.hpp"
#include <ThreadSafeMap.hpp>
#include <mutex>
#include <unordered_map>

namespace budget::adapters::secondary {

/**
 * @brief In-memory реализация репозитория займов
 */
class InMemoryLoanRepository : public ports::output::ILoanRepository {
public:
    void save(const domain::Loan& loan) override {
        bool existed = loans_.contains(loan.id);
        loans_.insert(loan.id, std::make_shared<domain::Loan>(loan));

        if (!existed) {
            std::lock_guard<std::mutex> lock(indexMutex_);
            ownerLoans_[loan.ownerId].push_back(loan.id);
        }
    }

    std::optional<domain::Loan> findById(const std::string& id) override {
        auto loan = loans_.find(id);
        return loan ? std::optional(*loan) : std::nullopt;
    }

    std::vector<domain::Loan> findByOwner(const std::string& ownerId) override {
        std::vector<std::string> ids;
        {
            std::lock_guard<std::mutex> lock(indexMutex_);
            auto it = ownerLoans_.find(ownerId);
            if (it != ownerLoans_.end()) {
                ids = it->second;
            }
        }

        std::vector<domain::Loan> result;
        for (const auto& id : ids) {
            if (auto loan = loans_.find(id)) {
                result.push_back(*loan);
            }
        }
        return result;
    }

    void savePayment(const domain::LoanPayment& payment) override {
        std::lock_guard<std::mutex> lock(paymentsMutex_);
        payments_[payment.loanId].push_back(payment);
    }

    std::vector<domain::LoanPayment> findPayments(const std::string& loanId) override {
        std::lock_guard<std::mutex> lock(paymentsMutex_);
        auto it = payments_.find(loanId);
        return it != payments_.end() ? it->second : std::vector<domain::LoanPayment>{};
    }

private:
    ThreadSafeMap<std::string, domain::Loan> loans_;

    mutable std::mutex indexMutex_;
    std::unordered_map<std::string, std::vector<std::string>> ownerLoans_;  // ownerId -> в порядке выдачи

    mutable std::mutex paymentsMutex_;
    std::unordered_map<std::string, std::vector<domain::LoanPayment>> payments_;  // loanId -> платежи
};

} // namespace budget::adapters::secondary
