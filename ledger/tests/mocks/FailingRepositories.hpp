#pragma once

#include "adapters/secondary/persistence/InMemoryAllocationRepository.hpp"
#include "adapters/secondary/persistence/InMemoryLoanRepository.hpp"
#include <stdexcept>

namespace budget::tests::mocks {

/**
 * @brief In-memory распределения, у которых следующие failSaves вызовов save падают
 */
class FailingAllocationRepository : public adapters::secondary::InMemoryAllocationRepository {
public:
    int failSaves = 0;

    void save(const domain::Allocation& allocation) override {
        if (failSaves > 0) {
            --failSaves;
            throw std::runtime_error("allocation storage unavailable");
        }
        InMemoryAllocationRepository::save(allocation);
    }
};

/**
 * @brief In-memory займы с управляемыми отказами save и savePayment
 */
class FailingLoanRepository : public adapters::secondary::InMemoryLoanRepository {
public:
    int failSaves = 0;
    int failPayments = 0;

    void save(const domain::Loan& loan) override {
        if (failSaves > 0) {
            --failSaves;
            throw std::runtime_error("loan storage unavailable");
        }
        InMemoryLoanRepository::save(loan);
    }

    void savePayment(const domain::LoanPayment& payment) override {
        if (failPayments > 0) {
            --failPayments;
            throw std::runtime_error("payment storage unavailable");
        }
        InMemoryLoanRepository::savePayment(payment);
    }
};

} // namespace budget::tests::mocks
