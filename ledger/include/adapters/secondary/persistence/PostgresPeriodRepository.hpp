#pragma once

#include "ports/output/IPeriodRepository.hpp"
#include "adapters/secondary/settings/DbSettings.hpp"
#include "adapters/secondary/persistence/PgRow.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <mutex>
#include <iostream>

namespace budget::adapters::secondary {

/**
 * @brief PostgreSQL реализация репозитория периодов
 *
 * Таблица: ledger_periods, UNIQUE (owner_id, start_date)
 */
class PostgresPeriodRepository : public ports::output::IPeriodRepository {
public:
    explicit PostgresPeriodRepository(std::shared_ptr<DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresPeriodRepository] Connecting..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresPeriodRepository] Connected" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresPeriodRepository] Connection failed: " << e.what() << std::endl;
            throw;
        }
        initSchema();
    }

    ~PostgresPeriodRepository() override {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    void saveAll(const std::vector<domain::WeeklyPeriod>& periods) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            for (const auto& period : periods) {
                txn.exec_params(
                    R"(
                        INSERT INTO ledger_periods (id, owner_id, start_date, end_date, created_at_ms)
                        VALUES ($1, $2, $3::date, $4::date, $5)
                        ON CONFLICT (id) DO NOTHING
                    )",
                    period.id,
                    period.ownerId,
                    period.startDate.toString(),
                    period.endDate.toString(),
                    period.createdAt.toUnixMillis()
                );
            }

            txn.commit();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresPeriodRepository] saveAll() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::WeeklyPeriod> findById(const std::string& id) override {
        return first(select("WHERE id = $1", id));
    }

    std::vector<domain::WeeklyPeriod> findByOwner(const std::string& ownerId) override {
        return select("WHERE owner_id = $1 ORDER BY start_date", ownerId);
    }

    std::optional<domain::WeeklyPeriod> findContaining(
        const std::string& ownerId, const domain::Date& date) override
    {
        return first(select(
            "WHERE owner_id = $1 AND start_date <= $2::date AND end_date > $2::date",
            ownerId, date.toString()));
    }

    std::optional<domain::WeeklyPeriod> findByStart(
        const std::string& ownerId, const domain::Date& startDate) override
    {
        return first(select("WHERE owner_id = $1 AND start_date = $2::date", ownerId, startDate.toString()));
    }

    std::optional<domain::WeeklyPeriod> findEarliest(const std::string& ownerId) override {
        return first(select("WHERE owner_id = $1 ORDER BY start_date LIMIT 1", ownerId));
    }

    std::optional<domain::WeeklyPeriod> findLatest(const std::string& ownerId) override {
        return first(select("WHERE owner_id = $1 ORDER BY start_date DESC LIMIT 1", ownerId));
    }

private:
    std::shared_ptr<DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;

    static std::optional<domain::WeeklyPeriod> first(const std::vector<domain::WeeklyPeriod>& periods) {
        if (periods.empty()) return std::nullopt;
        return periods.front();
    }

    template <typename... Params>
    std::vector<domain::WeeklyPeriod> select(const std::string& where, const Params&... params) {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                "SELECT id, owner_id, start_date, end_date, created_at_ms FROM ledger_periods " + where,
                params...
            );

            txn.commit();

            std::vector<domain::WeeklyPeriod> periods;
            for (const auto& row : result) {
                domain::WeeklyPeriod period;
                period.id = row["id"].as<std::string>();
                period.ownerId = row["owner_id"].as<std::string>();
                period.startDate = pg::date(row, "start_date");
                period.endDate = pg::date(row, "end_date");
                period.createdAt = pg::timestamp(row, "created_at_ms");
                periods.push_back(period);
            }
            return periods;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresPeriodRepository] select failed: " << e.what() << std::endl;
            throw;
        }
    }

    void initSchema() {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS ledger_periods (
                    id VARCHAR(64) PRIMARY KEY,
                    owner_id VARCHAR(64) NOT NULL,
                    start_date DATE NOT NULL,
                    end_date DATE NOT NULL,
                    created_at_ms BIGINT NOT NULL,
                    UNIQUE (owner_id, start_date)
                )
            )");

            txn.commit();
            std::cout << "[PostgresPeriodRepository] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresPeriodRepository] initSchema error: " << e.what() << std::endl;
            throw;
        }
    }
};

} // namespace budget::adapters::secondary
