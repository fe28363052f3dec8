#pragma once

#include "ports/output/IAllocationRepository.hpp"
#include "adapters/secondary/settings/DbSettings.hpp"
#include "adapters/secondary/persistence/PgRow.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <mutex>
#include <iostream>

namespace budget::adapters::secondary {

/**
 * @brief PostgreSQL реализация репозитория распределений
 *
 * Таблица: ledger_allocations, порядок создания хранит seq.
 */
class PostgresAllocationRepository : public ports::output::IAllocationRepository {
public:
    explicit PostgresAllocationRepository(std::shared_ptr<DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresAllocationRepository] Connecting..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresAllocationRepository] Connected" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresAllocationRepository] Connection failed: " << e.what() << std::endl;
            throw;
        }
        initSchema();
    }

    ~PostgresAllocationRepository() override {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    void save(const domain::Allocation& allocation) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            txn.exec_params(
                R"(
                    INSERT INTO ledger_allocations (
                        id, owner_id, template_id, source_account_id, destination_account_id,
                        period_id, amount_units, amount_nano, processed, partially_funded,
                        reversed, debit_transaction_id, credit_transaction_id, notes, created_at_ms
                    )
                    VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, $15)
                    ON CONFLICT (id) DO UPDATE SET
                        processed = EXCLUDED.processed,
                        partially_funded = EXCLUDED.partially_funded,
                        reversed = EXCLUDED.reversed,
                        debit_transaction_id = EXCLUDED.debit_transaction_id,
                        credit_transaction_id = EXCLUDED.credit_transaction_id,
                        notes = EXCLUDED.notes
                )",
                allocation.id,
                allocation.ownerId,
                allocation.templateId,
                allocation.sourceAccountId,
                allocation.destinationAccountId,
                allocation.periodId,
                allocation.amount.units,
                allocation.amount.nano,
                allocation.processed,
                allocation.partiallyFunded,
                allocation.reversed,
                allocation.debitTransactionId,
                allocation.creditTransactionId,
                allocation.notes,
                allocation.createdAt.toUnixMillis()
            );

            txn.commit();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresAllocationRepository] save() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::Allocation> findById(const std::string& id) override {
        auto found = select("id = $1", id);
        if (found.empty()) return std::nullopt;
        return found.front();
    }

    std::vector<domain::Allocation> findByPeriod(
        const std::string& ownerId, const std::string& periodId) override
    {
        return select("owner_id = $1 AND period_id = $2", ownerId, periodId);
    }

    std::vector<domain::Allocation> findByOwner(const std::string& ownerId) override {
        return select("owner_id = $1", ownerId);
    }

private:
    std::shared_ptr<DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;

    template <typename... Params>
    std::vector<domain::Allocation> select(const std::string& condition, const Params&... params) {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                R"(SELECT id, owner_id, template_id, source_account_id, destination_account_id,
                          period_id, amount_units, amount_nano, processed, partially_funded,
                          reversed, debit_transaction_id, credit_transaction_id, notes, created_at_ms
                   FROM ledger_allocations WHERE )" + condition + " ORDER BY seq",
                params...
            );

            txn.commit();

            std::vector<domain::Allocation> allocations;
            for (const auto& row : result) {
                domain::Allocation allocation;
                allocation.id = row["id"].as<std::string>();
                allocation.ownerId = row["owner_id"].as<std::string>();
                allocation.templateId = pg::optionalString(row, "template_id");
                allocation.sourceAccountId = row["source_account_id"].as<std::string>();
                allocation.destinationAccountId = row["destination_account_id"].as<std::string>();
                allocation.periodId = row["period_id"].as<std::string>();
                allocation.amount = pg::money(row, "amount");
                allocation.processed = row["processed"].as<bool>();
                allocation.partiallyFunded = row["partially_funded"].as<bool>();
                allocation.reversed = row["reversed"].as<bool>();
                allocation.debitTransactionId = pg::text(row, "debit_transaction_id");
                allocation.creditTransactionId = pg::text(row, "credit_transaction_id");
                allocation.notes = pg::text(row, "notes");
                allocation.createdAt = pg::timestamp(row, "created_at_ms");
                allocations.push_back(allocation);
            }
            return allocations;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresAllocationRepository] select failed: " << e.what() << std::endl;
            throw;
        }
    }

    void initSchema() {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS ledger_allocations (
                    seq BIGSERIAL,
                    id VARCHAR(64) PRIMARY KEY,
                    owner_id VARCHAR(64) NOT NULL,
                    template_id VARCHAR(64),
                    source_account_id VARCHAR(64) NOT NULL,
                    destination_account_id VARCHAR(64) NOT NULL,
                    period_id VARCHAR(64) NOT NULL,
                    amount_units BIGINT NOT NULL,
                    amount_nano INTEGER NOT NULL,
                    processed BOOLEAN NOT NULL DEFAULT FALSE,
                    partially_funded BOOLEAN NOT NULL DEFAULT FALSE,
                    reversed BOOLEAN NOT NULL DEFAULT FALSE,
                    debit_transaction_id VARCHAR(64),
                    credit_transaction_id VARCHAR(64),
                    notes TEXT,
                    created_at_ms BIGINT NOT NULL
                )
            )");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_ledger_allocations_period ON ledger_allocations(owner_id, period_id)");

            txn.commit();
            std::cout << "[PostgresAllocationRepository] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresAllocationRepository] initSchema error: " << e.what() << std::endl;
            throw;
        }
    }
};

} // namespace budget::adapters::secondary
