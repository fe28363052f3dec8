#pragma once

#include "ports/output/IAccountRepository.hpp"
#include "adapters/secondary/settings/DbSettings.hpp"
#include "adapters/secondary/persistence/PgRow.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <mutex>
#include <iostream>

namespace budget::adapters::secondary {

/**
 * @brief PostgreSQL реализация репозитория счетов
 *
 * Таблицы: ledger_accounts, ledger_account_events
 */
class PostgresAccountRepository : public ports::output::IAccountRepository {
public:
    explicit PostgresAccountRepository(std::shared_ptr<DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresAccountRepository] Connecting..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresAccountRepository] Connected" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountRepository] Connection failed: " << e.what() << std::endl;
            throw;
        }
        initSchema();
    }

    ~PostgresAccountRepository() override {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    void save(const domain::Account& account) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            txn.exec_params(
                R"(
                    INSERT INTO ledger_accounts (
                        id, owner_id, name, category, parent_id,
                        target_units, target_nano, balance_units, balance_nano,
                        active, sort_order, is_root, description, created_at_ms
                    )
                    VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14)
                    ON CONFLICT (id) DO UPDATE SET
                        owner_id = EXCLUDED.owner_id,
                        name = EXCLUDED.name,
                        category = EXCLUDED.category,
                        parent_id = EXCLUDED.parent_id,
                        target_units = EXCLUDED.target_units,
                        target_nano = EXCLUDED.target_nano,
                        balance_units = EXCLUDED.balance_units,
                        balance_nano = EXCLUDED.balance_nano,
                        active = EXCLUDED.active,
                        sort_order = EXCLUDED.sort_order,
                        is_root = EXCLUDED.is_root,
                        description = EXCLUDED.description
                )",
                account.id,
                account.ownerId,
                account.name,
                domain::toString(account.category),
                account.parentId,
                pg::optionalUnits(account.targetAmount),
                pg::optionalNano(account.targetAmount),
                account.currentBalance.units,
                account.currentBalance.nano,
                account.active,
                account.sortOrder,
                account.isRoot,
                account.description,
                account.createdAt.toUnixMillis()
            );

            txn.commit();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountRepository] save() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::Account> findById(const std::string& id) override {
        auto accounts = select("WHERE id = $1", id);
        if (accounts.empty()) return std::nullopt;
        return accounts.front();
    }

    std::vector<domain::Account> findByOwner(const std::string& ownerId) override {
        return select("WHERE owner_id = $1 ORDER BY created_at_ms, id", ownerId);
    }

    std::vector<domain::Account> findWithoutOwner() override {
        return select("WHERE owner_id = $1", std::string());
    }

    bool deleteById(const std::string& id) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            txn.exec_params("DELETE FROM ledger_account_events WHERE account_id = $1", id);
            auto result = txn.exec_params("DELETE FROM ledger_accounts WHERE id = $1", id);

            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountRepository] deleteById() failed: " << e.what() << std::endl;
            throw;
        }
    }

    bool adjustBalance(const std::string& id, const domain::Money& delta) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                "SELECT balance_units, balance_nano FROM ledger_accounts WHERE id = $1 FOR UPDATE",
                id
            );
            if (result.empty()) {
                return false;
            }

            auto balance = pg::money(result[0], "balance") + delta;
            txn.exec_params(
                "UPDATE ledger_accounts SET balance_units = $2, balance_nano = $3 WHERE id = $1",
                id, balance.units, balance.nano
            );

            txn.commit();
            return true;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountRepository] adjustBalance() failed: " << e.what() << std::endl;
            throw;
        }
    }

    bool setCachedBalance(const std::string& id, const domain::Money& balance) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                "UPDATE ledger_accounts SET balance_units = $2, balance_nano = $3 WHERE id = $1",
                id, balance.units, balance.nano
            );

            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountRepository] setCachedBalance() failed: " << e.what() << std::endl;
            throw;
        }
    }

    void appendEvent(const domain::AccountEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            txn.exec_params(
                R"(
                    INSERT INTO ledger_account_events (
                        id, account_id, owner_id, action, old_value, new_value, created_at_ms
                    )
                    VALUES ($1, $2, $3, $4, $5, $6, $7)
                )",
                event.id,
                event.accountId,
                event.ownerId,
                domain::toString(event.action),
                event.oldValue,
                event.newValue,
                event.timestamp.toUnixMillis()
            );

            txn.commit();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountRepository] appendEvent() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::AccountEvent> findEvents(const std::string& accountId) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                R"(SELECT id, account_id, owner_id, action, old_value, new_value, created_at_ms
                   FROM ledger_account_events WHERE account_id = $1 ORDER BY seq)",
                accountId
            );

            txn.commit();

            std::vector<domain::AccountEvent> events;
            for (const auto& row : result) {
                domain::AccountEvent event;
                event.id = row["id"].as<std::string>();
                event.accountId = row["account_id"].as<std::string>();
                event.ownerId = row["owner_id"].as<std::string>();
                event.action = domain::accountActionFromString(row["action"].as<std::string>());
                event.oldValue = pg::text(row, "old_value");
                event.newValue = pg::text(row, "new_value");
                event.timestamp = pg::timestamp(row, "created_at_ms");
                events.push_back(event);
            }
            return events;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountRepository] findEvents() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;

    std::vector<domain::Account> select(const std::string& where, const std::string& param) {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                R"(SELECT id, owner_id, name, category, parent_id, target_units, target_nano,
                          balance_units, balance_nano, active, sort_order, is_root,
                          description, created_at_ms
                   FROM ledger_accounts )" + where,
                param
            );

            txn.commit();

            std::vector<domain::Account> accounts;
            for (const auto& row : result) {
                accounts.push_back(rowToAccount(row));
            }
            return accounts;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountRepository] select failed: " << e.what() << std::endl;
            throw;
        }
    }

    domain::Account rowToAccount(const pqxx::row& row) const {
        domain::Account account;
        account.id = row["id"].as<std::string>();
        account.ownerId = pg::text(row, "owner_id");
        account.name = row["name"].as<std::string>();
        account.category = domain::accountCategoryFromString(row["category"].as<std::string>());
        account.parentId = pg::optionalString(row, "parent_id");
        account.targetAmount = pg::optionalMoney(row, "target");
        account.currentBalance = pg::money(row, "balance");
        account.active = row["active"].as<bool>();
        account.sortOrder = row["sort_order"].as<int>();
        account.isRoot = row["is_root"].as<bool>();
        account.description = pg::text(row, "description");
        account.createdAt = pg::timestamp(row, "created_at_ms");
        return account;
    }

    void initSchema() {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS ledger_accounts (
                    id VARCHAR(64) PRIMARY KEY,
                    owner_id VARCHAR(64) NOT NULL DEFAULT '',
                    name VARCHAR(255) NOT NULL,
                    category VARCHAR(16) NOT NULL,
                    parent_id VARCHAR(64),
                    target_units BIGINT,
                    target_nano INTEGER,
                    balance_units BIGINT NOT NULL DEFAULT 0,
                    balance_nano INTEGER NOT NULL DEFAULT 0,
                    active BOOLEAN NOT NULL DEFAULT TRUE,
                    sort_order INTEGER NOT NULL DEFAULT 0,
                    is_root BOOLEAN NOT NULL DEFAULT FALSE,
                    description TEXT,
                    created_at_ms BIGINT NOT NULL
                )
            )");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_ledger_accounts_owner ON ledger_accounts(owner_id)");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS ledger_account_events (
                    seq BIGSERIAL PRIMARY KEY,
                    id VARCHAR(64) NOT NULL,
                    account_id VARCHAR(64) NOT NULL,
                    owner_id VARCHAR(64) NOT NULL,
                    action VARCHAR(16) NOT NULL,
                    old_value TEXT,
                    new_value TEXT,
                    created_at_ms BIGINT NOT NULL
                )
            )");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_ledger_account_events_account ON ledger_account_events(account_id)");

            txn.commit();
            std::cout << "[PostgresAccountRepository] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountRepository] initSchema error: " << e.what() << std::endl;
            throw;
        }
    }
};

} // namespace budget::adapters::secondary
