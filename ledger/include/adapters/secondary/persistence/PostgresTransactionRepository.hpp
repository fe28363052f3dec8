#pragma once

#include "ports/output/ITransactionRepository.hpp"
#include "adapters/secondary/settings/DbSettings.hpp"
#include "adapters/secondary/persistence/PgRow.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <mutex>
#include <iostream>

namespace budget::adapters::secondary {

/**
 * @brief PostgreSQL журнал проводок
 *
 * Таблица: ledger_transactions, sequence назначается BIGSERIAL.
 * Все проводки одной операции пишутся в одной транзакции БД.
 */
class PostgresTransactionRepository : public ports::output::ITransactionRepository {
public:
    explicit PostgresTransactionRepository(std::shared_ptr<DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresTransactionRepository] Connecting..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresTransactionRepository] Connected" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresTransactionRepository] Connection failed: " << e.what() << std::endl;
            throw;
        }
        initSchema();
    }

    ~PostgresTransactionRepository() override {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    std::vector<domain::Transaction> append(const std::vector<domain::Transaction>& transactions) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            std::vector<domain::Transaction> stored;
            for (const auto& transaction : transactions) {
                auto result = txn.exec_params(
                    R"(
                        INSERT INTO ledger_transactions (
                            id, owner_id, account_id, period_id, period_start,
                            amount_units, amount_nano, kind, description,
                            created_at_ms, transfer_id, reverses_id
                        )
                        VALUES ($1, $2, $3, $4, $5::date, $6, $7, $8, $9, $10, $11, $12)
                        RETURNING sequence
                    )",
                    transaction.id,
                    transaction.ownerId,
                    transaction.accountId,
                    transaction.periodId,
                    transaction.periodStart.toString(),
                    transaction.amount.units,
                    transaction.amount.nano,
                    domain::toString(transaction.kind),
                    transaction.description,
                    transaction.timestamp.toUnixMillis(),
                    transaction.transferId,
                    transaction.reversesId
                );

                domain::Transaction copy = transaction;
                copy.sequence = result[0]["sequence"].as<int64_t>();
                stored.push_back(copy);
            }

            txn.commit();
            return stored;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresTransactionRepository] append() failed: " << e.what() << std::endl;
            throw;
        }
    }

    void discard(const std::vector<std::string>& transactionIds) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            for (const auto& id : transactionIds) {
                txn.exec_params("DELETE FROM ledger_transactions WHERE id = $1", id);
            }
            txn.commit();
            std::cout << "[PostgresTransactionRepository] Discarded " << transactionIds.size()
                      << " transaction(s)" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresTransactionRepository] discard() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::Transaction> findById(const std::string& id) override {
        auto found = select("id = $1", id);
        if (found.empty()) return std::nullopt;
        return found.front();
    }

    std::vector<domain::Transaction> findByAccount(const std::string& accountId) override {
        return select("account_id = $1", accountId);
    }

    std::vector<domain::Transaction> findByOwner(const std::string& ownerId) override {
        return select("owner_id = $1", ownerId);
    }

    std::vector<domain::Transaction> findByTransferId(const std::string& transferId) override {
        return select("transfer_id = $1", transferId);
    }

    std::vector<domain::Transaction> findReversalsOf(const std::string& transactionId) override {
        return select("reverses_id = $1", transactionId);
    }

private:
    std::shared_ptr<DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;

    std::vector<domain::Transaction> select(const std::string& condition, const std::string& param) {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                R"(SELECT sequence, id, owner_id, account_id, period_id, period_start,
                          amount_units, amount_nano, kind, description,
                          created_at_ms, transfer_id, reverses_id
                   FROM ledger_transactions WHERE )" + condition + " ORDER BY sequence",
                param
            );

            txn.commit();

            std::vector<domain::Transaction> transactions;
            for (const auto& row : result) {
                transactions.push_back(rowToTransaction(row));
            }
            return transactions;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresTransactionRepository] select failed: " << e.what() << std::endl;
            throw;
        }
    }

    domain::Transaction rowToTransaction(const pqxx::row& row) const {
        domain::Transaction transaction;
        transaction.sequence = row["sequence"].as<int64_t>();
        transaction.id = row["id"].as<std::string>();
        transaction.ownerId = row["owner_id"].as<std::string>();
        transaction.accountId = row["account_id"].as<std::string>();
        transaction.periodId = row["period_id"].as<std::string>();
        transaction.periodStart = pg::date(row, "period_start");
        transaction.amount = pg::money(row, "amount");
        transaction.kind = domain::transactionKindFromString(row["kind"].as<std::string>());
        transaction.description = pg::text(row, "description");
        transaction.timestamp = pg::timestamp(row, "created_at_ms");
        transaction.transferId = pg::optionalString(row, "transfer_id");
        transaction.reversesId = pg::optionalString(row, "reverses_id");
        return transaction;
    }

    void initSchema() {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS ledger_transactions (
                    sequence BIGSERIAL PRIMARY KEY,
                    id VARCHAR(64) NOT NULL UNIQUE,
                    owner_id VARCHAR(64) NOT NULL,
                    account_id VARCHAR(64) NOT NULL,
                    period_id VARCHAR(64) NOT NULL,
                    period_start DATE NOT NULL,
                    amount_units BIGINT NOT NULL,
                    amount_nano INTEGER NOT NULL,
                    kind VARCHAR(32) NOT NULL,
                    description TEXT,
                    created_at_ms BIGINT NOT NULL,
                    transfer_id VARCHAR(64),
                    reverses_id VARCHAR(64)
                )
            )");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_ledger_transactions_account ON ledger_transactions(account_id)");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_ledger_transactions_owner ON ledger_transactions(owner_id)");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_ledger_transactions_transfer ON ledger_transactions(transfer_id)");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_ledger_transactions_reverses ON ledger_transactions(reverses_id)");

            txn.commit();
            std::cout << "[PostgresTransactionRepository] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresTransactionRepository] initSchema error: " << e.what() << std::endl;
            throw;
        }
    }
};

} // namespace budget::adapters::secondary
