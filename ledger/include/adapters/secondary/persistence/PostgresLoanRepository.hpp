#pragma once

#include "ports/output/ILoanRepository.hpp"
#include "adapters/secondary/settings/DbSettings.hpp"
#include "adapters/secondary/persistence/PgRow.hpp"
#include <pqxx/pqxx>
#include <map>
#include <memory>
#include <mutex>
#include <iostream>

namespace budget::adapters::secondary {

/**
 * @brief PostgreSQL реализация репозитория займов
 *
 * Таблицы: ledger_loans, ledger_loan_accruals (периоды с начисленными
 * процентами), ledger_loan_payments.
 */
class PostgresLoanRepository : public ports::output::ILoanRepository {
public:
    explicit PostgresLoanRepository(std::shared_ptr<DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresLoanRepository] Connecting..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresLoanRepository] Connected" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLoanRepository] Connection failed: " << e.what() << std::endl;
            throw;
        }
        initSchema();
    }

    ~PostgresLoanRepository() override {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    void save(const domain::Loan& loan) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            std::optional<int64_t> paidAt;
            if (loan.paidAt) {
                paidAt = loan.paidAt->toUnixMillis();
            }

            txn.exec_params(
                R"(
                    INSERT INTO ledger_loans (
                        id, owner_id, lender_account_id, borrower_account_id,
                        principal_units, principal_nano, rate_nanos,
                        outstanding_units, outstanding_nano, total_interest_units, total_interest_nano,
                        status, disbursement_period_id, description, created_at_ms, paid_at_ms
                    )
                    VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, $15, $16)
                    ON CONFLICT (id) DO UPDATE SET
                        outstanding_units = EXCLUDED.outstanding_units,
                        outstanding_nano = EXCLUDED.outstanding_nano,
                        total_interest_units = EXCLUDED.total_interest_units,
                        total_interest_nano = EXCLUDED.total_interest_nano,
                        status = EXCLUDED.status,
                        paid_at_ms = EXCLUDED.paid_at_ms
                )",
                loan.id,
                loan.ownerId,
                loan.lenderAccountId,
                loan.borrowerAccountId,
                loan.principal.units,
                loan.principal.nano,
                loan.ratePerPeriod.nanos,
                loan.outstanding.units,
                loan.outstanding.nano,
                loan.totalInterest.units,
                loan.totalInterest.nano,
                domain::toString(loan.status),
                loan.disbursementPeriodId,
                loan.description,
                loan.createdAt.toUnixMillis(),
                paidAt
            );

            for (const auto& periodId : loan.accruedPeriods) {
                txn.exec_params(
                    R"(INSERT INTO ledger_loan_accruals (loan_id, period_id) VALUES ($1, $2)
                       ON CONFLICT DO NOTHING)",
                    loan.id, periodId
                );
            }

            txn.commit();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLoanRepository] save() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::Loan> findById(const std::string& id) override {
        auto loans = select("l.id = $1", id);
        if (loans.empty()) return std::nullopt;
        return loans.front();
    }

    std::vector<domain::Loan> findByOwner(const std::string& ownerId) override {
        return select("l.owner_id = $1", ownerId);
    }

    void savePayment(const domain::LoanPayment& payment) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            txn.exec_params(
                R"(
                    INSERT INTO ledger_loan_payments (
                        id, loan_id, period_id, amount_units, amount_nano,
                        outstanding_after_units, outstanding_after_nano, notes, created_at_ms
                    )
                    VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9)
                )",
                payment.id,
                payment.loanId,
                payment.periodId,
                payment.amount.units,
                payment.amount.nano,
                payment.outstandingAfter.units,
                payment.outstandingAfter.nano,
                payment.notes,
                payment.timestamp.toUnixMillis()
            );

            txn.commit();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLoanRepository] savePayment() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::LoanPayment> findPayments(const std::string& loanId) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                R"(SELECT id, loan_id, period_id, amount_units, amount_nano,
                          outstanding_after_units, outstanding_after_nano, notes, created_at_ms
                   FROM ledger_loan_payments WHERE loan_id = $1 ORDER BY seq)",
                loanId
            );

            txn.commit();

            std::vector<domain::LoanPayment> payments;
            for (const auto& row : result) {
                domain::LoanPayment payment;
                payment.id = row["id"].as<std::string>();
                payment.loanId = row["loan_id"].as<std::string>();
                payment.periodId = row["period_id"].as<std::string>();
                payment.amount = pg::money(row, "amount");
                payment.outstandingAfter = pg::money(row, "outstanding_after");
                payment.notes = pg::text(row, "notes");
                payment.timestamp = pg::timestamp(row, "created_at_ms");
                payments.push_back(payment);
            }
            return payments;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLoanRepository] findPayments() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;

    std::vector<domain::Loan> select(const std::string& condition, const std::string& param) {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                R"(SELECT l.id, l.owner_id, l.lender_account_id, l.borrower_account_id,
                          l.principal_units, l.principal_nano, l.rate_nanos,
                          l.outstanding_units, l.outstanding_nano,
                          l.total_interest_units, l.total_interest_nano,
                          l.status, l.disbursement_period_id, l.description,
                          l.created_at_ms, l.paid_at_ms
                   FROM ledger_loans l WHERE )" + condition + " ORDER BY l.seq",
                param
            );

            auto accruals = txn.exec_params(
                R"(SELECT a.loan_id, a.period_id
                   FROM ledger_loan_accruals a JOIN ledger_loans l ON l.id = a.loan_id
                   WHERE )" + condition,
                param
            );

            txn.commit();

            std::map<std::string, std::set<std::string>> accruedByLoan;
            for (const auto& row : accruals) {
                accruedByLoan[row["loan_id"].as<std::string>()].insert(row["period_id"].as<std::string>());
            }

            std::vector<domain::Loan> loans;
            for (const auto& row : result) {
                domain::Loan loan;
                loan.id = row["id"].as<std::string>();
                loan.ownerId = row["owner_id"].as<std::string>();
                loan.lenderAccountId = row["lender_account_id"].as<std::string>();
                loan.borrowerAccountId = row["borrower_account_id"].as<std::string>();
                loan.principal = pg::money(row, "principal");
                loan.ratePerPeriod = pg::rate(row, "rate");
                loan.outstanding = pg::money(row, "outstanding");
                loan.totalInterest = pg::money(row, "total_interest");
                loan.status = domain::loanStatusFromString(row["status"].as<std::string>());
                loan.disbursementPeriodId = row["disbursement_period_id"].as<std::string>();
                loan.description = pg::text(row, "description");
                loan.accruedPeriods = accruedByLoan[loan.id];
                loan.createdAt = pg::timestamp(row, "created_at_ms");
                if (!row["paid_at_ms"].is_null()) {
                    loan.paidAt = pg::timestamp(row, "paid_at_ms");
                }
                loans.push_back(loan);
            }
            return loans;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLoanRepository] select failed: " << e.what() << std::endl;
            throw;
        }
    }

    void initSchema() {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS ledger_loans (
                    seq BIGSERIAL,
                    id VARCHAR(64) PRIMARY KEY,
                    owner_id VARCHAR(64) NOT NULL,
                    lender_account_id VARCHAR(64) NOT NULL,
                    borrower_account_id VARCHAR(64) NOT NULL,
                    principal_units BIGINT NOT NULL,
                    principal_nano INTEGER NOT NULL,
                    rate_nanos BIGINT NOT NULL,
                    outstanding_units BIGINT NOT NULL,
                    outstanding_nano INTEGER NOT NULL,
                    total_interest_units BIGINT NOT NULL DEFAULT 0,
                    total_interest_nano INTEGER NOT NULL DEFAULT 0,
                    status VARCHAR(16) NOT NULL,
                    disbursement_period_id VARCHAR(64) NOT NULL,
                    description TEXT,
                    created_at_ms BIGINT NOT NULL,
                    paid_at_ms BIGINT
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS ledger_loan_accruals (
                    loan_id VARCHAR(64) NOT NULL,
                    period_id VARCHAR(64) NOT NULL,
                    PRIMARY KEY (loan_id, period_id)
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS ledger_loan_payments (
                    seq BIGSERIAL PRIMARY KEY,
                    id VARCHAR(64) NOT NULL UNIQUE,
                    loan_id VARCHAR(64) NOT NULL,
                    period_id VARCHAR(64) NOT NULL,
                    amount_units BIGINT NOT NULL,
                    amount_nano INTEGER NOT NULL,
                    outstanding_after_units BIGINT NOT NULL,
                    outstanding_after_nano INTEGER NOT NULL,
                    notes TEXT,
                    created_at_ms BIGINT NOT NULL
                )
            )");

            txn.commit();
            std::cout << "[PostgresLoanRepository] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLoanRepository] initSchema error: " << e.what() << std::endl;
            throw;
        }
    }
};

} // namespace budget::adapters::secondary
