#pragma once

#include "ports/output/ITemplateRepository.hpp"
#include "adapters/secondary/settings/DbSettings.hpp"
#include "adapters/secondary/persistence/PgRow.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <mutex>
#include <iostream>

namespace budget::adapters::secondary {

/**
 * @brief PostgreSQL реализация репозитория шаблонов
 *
 * Таблица: ledger_templates. Правило хранится в колонках rule_type,
 * rule_amount (FIXED сумма или RANGE минимум), rule_max (RANGE),
 * rule_percentage_nanos (PERCENTAGE). creation_order назначает BIGSERIAL.
 */
class PostgresTemplateRepository : public ports::output::ITemplateRepository {
public:
    explicit PostgresTemplateRepository(std::shared_ptr<DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresTemplateRepository] Connecting..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresTemplateRepository] Connected" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresTemplateRepository] Connection failed: " << e.what() << std::endl;
            throw;
        }
        initSchema();
    }

    ~PostgresTemplateRepository() override {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    domain::BudgetTemplate add(const domain::BudgetTemplate& budgetTemplate) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            RuleColumns rule = toColumns(budgetTemplate.rule);
            auto result = txn.exec_params(
                R"(
                    INSERT INTO ledger_templates (
                        id, owner_id, destination_account_id, rule_type,
                        rule_amount_units, rule_amount_nano, rule_max_units, rule_max_nano,
                        rule_percentage_nanos, priority, active, notes, created_at_ms
                    )
                    VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13)
                    RETURNING creation_order
                )",
                budgetTemplate.id,
                budgetTemplate.ownerId,
                budgetTemplate.destinationAccountId,
                domain::ruleTypeName(budgetTemplate.rule),
                rule.amount.units,
                rule.amount.nano,
                rule.max.units,
                rule.max.nano,
                rule.percentage.nanos,
                budgetTemplate.priority,
                budgetTemplate.active,
                budgetTemplate.notes,
                budgetTemplate.createdAt.toUnixMillis()
            );

            txn.commit();

            domain::BudgetTemplate stored = budgetTemplate;
            stored.creationOrder = result[0]["creation_order"].as<int64_t>();
            return stored;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresTemplateRepository] add() failed: " << e.what() << std::endl;
            throw;
        }
    }

    bool update(const domain::BudgetTemplate& budgetTemplate) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            RuleColumns rule = toColumns(budgetTemplate.rule);
            auto result = txn.exec_params(
                R"(
                    UPDATE ledger_templates SET
                        destination_account_id = $2,
                        rule_type = $3,
                        rule_amount_units = $4,
                        rule_amount_nano = $5,
                        rule_max_units = $6,
                        rule_max_nano = $7,
                        rule_percentage_nanos = $8,
                        priority = $9,
                        active = $10,
                        notes = $11
                    WHERE id = $1
                )",
                budgetTemplate.id,
                budgetTemplate.destinationAccountId,
                domain::ruleTypeName(budgetTemplate.rule),
                rule.amount.units,
                rule.amount.nano,
                rule.max.units,
                rule.max.nano,
                rule.percentage.nanos,
                budgetTemplate.priority,
                budgetTemplate.active,
                budgetTemplate.notes
            );

            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresTemplateRepository] update() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::BudgetTemplate> findById(const std::string& id) override {
        auto found = select("id = $1", id);
        if (found.empty()) return std::nullopt;
        return found.front();
    }

    std::vector<domain::BudgetTemplate> findByOwner(const std::string& ownerId) override {
        return select("owner_id = $1", ownerId);
    }

    bool deleteById(const std::string& id) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params("DELETE FROM ledger_templates WHERE id = $1", id);

            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresTemplateRepository] deleteById() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;

    struct RuleColumns {
        domain::Money amount;
        domain::Money max;
        domain::Rate percentage;
    };

    static RuleColumns toColumns(const domain::AllocationRule& rule) {
        RuleColumns columns;
        if (auto fixed = std::get_if<domain::FixedRule>(&rule)) {
            columns.amount = fixed->amount;
        } else if (auto percent = std::get_if<domain::PercentageRule>(&rule)) {
            columns.percentage = percent->percentage;
        } else if (auto range = std::get_if<domain::RangeRule>(&rule)) {
            columns.amount = range->min;
            columns.max = range->max;
        }
        return columns;
    }

    static domain::AllocationRule fromColumns(const pqxx::row& row) {
        std::string type = row["rule_type"].as<std::string>();
        if (type == "FIXED") {
            return domain::FixedRule{pg::money(row, "rule_amount")};
        }
        if (type == "PERCENTAGE") {
            return domain::PercentageRule{pg::rate(row, "rule_percentage")};
        }
        if (type == "RANGE") {
            return domain::RangeRule{pg::money(row, "rule_amount"), pg::money(row, "rule_max")};
        }
        throw std::invalid_argument("Unknown rule type in ledger_templates: " + type);
    }

    std::vector<domain::BudgetTemplate> select(const std::string& condition, const std::string& param) {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                R"(SELECT id, owner_id, destination_account_id, rule_type,
                          rule_amount_units, rule_amount_nano, rule_max_units, rule_max_nano,
                          rule_percentage_nanos, priority, creation_order, active, notes, created_at_ms
                   FROM ledger_templates WHERE )" + condition + " ORDER BY creation_order",
                param
            );

            txn.commit();

            std::vector<domain::BudgetTemplate> templates;
            for (const auto& row : result) {
                domain::BudgetTemplate budgetTemplate;
                budgetTemplate.id = row["id"].as<std::string>();
                budgetTemplate.ownerId = row["owner_id"].as<std::string>();
                budgetTemplate.destinationAccountId = row["destination_account_id"].as<std::string>();
                budgetTemplate.rule = fromColumns(row);
                budgetTemplate.priority = row["priority"].as<int>();
                budgetTemplate.creationOrder = row["creation_order"].as<int64_t>();
                budgetTemplate.active = row["active"].as<bool>();
                budgetTemplate.notes = pg::text(row, "notes");
                budgetTemplate.createdAt = pg::timestamp(row, "created_at_ms");
                templates.push_back(budgetTemplate);
            }
            return templates;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresTemplateRepository] select failed: " << e.what() << std::endl;
            throw;
        }
    }

    void initSchema() {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS ledger_templates (
                    id VARCHAR(64) PRIMARY KEY,
                    creation_order BIGSERIAL,
                    owner_id VARCHAR(64) NOT NULL,
                    destination_account_id VARCHAR(64) NOT NULL,
                    rule_type VARCHAR(16) NOT NULL,
                    rule_amount_units BIGINT NOT NULL DEFAULT 0,
                    rule_amount_nano INTEGER NOT NULL DEFAULT 0,
                    rule_max_units BIGINT NOT NULL DEFAULT 0,
                    rule_max_nano INTEGER NOT NULL DEFAULT 0,
                    rule_percentage_nanos BIGINT NOT NULL DEFAULT 0,
                    priority INTEGER NOT NULL DEFAULT 0,
                    active BOOLEAN NOT NULL DEFAULT TRUE,
                    notes TEXT,
                    created_at_ms BIGINT NOT NULL
                )
            )");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_ledger_templates_owner ON ledger_templates(owner_id)");

            txn.commit();
            std::cout << "[PostgresTemplateRepository] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresTemplateRepository] initSchema error: " << e.what() << std::endl;
            throw;
        }
    }
};

} // namespace budget::adapters::secondary
