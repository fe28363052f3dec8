#pragma once

#include "ports/output/ISettingsRepository.hpp"
#include "adapters/secondary/settings/DbSettings.hpp"
#include "adapters/secondary/persistence/PgRow.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <mutex>
#include <iostream>

namespace budget::adapters::secondary {

/**
 * @brief PostgreSQL хранилище настроек владельцев
 *
 * Таблица: ledger_owner_settings
 */
class PostgresSettingsRepository : public ports::output::ISettingsRepository {
public:
    explicit PostgresSettingsRepository(std::shared_ptr<DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresSettingsRepository] Connecting..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresSettingsRepository] Connected" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresSettingsRepository] Connection failed: " << e.what() << std::endl;
            throw;
        }
        initSchema();
    }

    ~PostgresSettingsRepository() override {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    std::optional<domain::OwnerSettings> find(const std::string& ownerId) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                R"(SELECT owner_id, week_start_day, default_rate_nanos, interest_bookkeeping,
                          auto_allocate, auto_repay, auto_repay_share_nanos,
                          auto_repay_threshold_units, auto_repay_threshold_nano,
                          utc_offset_minutes, epoch
                   FROM ledger_owner_settings WHERE owner_id = $1)",
                ownerId
            );

            txn.commit();

            if (result.empty()) return std::nullopt;

            const auto& row = result[0];
            domain::OwnerSettings settings;
            settings.ownerId = row["owner_id"].as<std::string>();
            settings.weekStartDay = row["week_start_day"].as<int>();
            settings.defaultInterestRate = pg::rate(row, "default_rate");
            settings.interestBookkeeping =
                domain::interestBookkeepingFromString(row["interest_bookkeeping"].as<std::string>());
            settings.autoAllocate = row["auto_allocate"].as<bool>();
            settings.autoRepay = row["auto_repay"].as<bool>();
            settings.autoRepayShare = pg::rate(row, "auto_repay_share");
            settings.autoRepayThreshold = pg::money(row, "auto_repay_threshold");
            settings.utcOffsetMinutes = row["utc_offset_minutes"].as<int>();
            if (!row["epoch"].is_null()) {
                settings.epoch = pg::date(row, "epoch");
            }
            return settings;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresSettingsRepository] find() failed: " << e.what() << std::endl;
            throw;
        }
    }

    void save(const domain::OwnerSettings& settings) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            std::optional<std::string> epoch;
            if (settings.epoch) {
                epoch = settings.epoch->toString();
            }

            txn.exec_params(
                R"(
                    INSERT INTO ledger_owner_settings (
                        owner_id, week_start_day, default_rate_nanos, interest_bookkeeping,
                        auto_allocate, auto_repay, auto_repay_share_nanos,
                        auto_repay_threshold_units, auto_repay_threshold_nano,
                        utc_offset_minutes, epoch
                    )
                    VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11::date)
                    ON CONFLICT (owner_id) DO UPDATE SET
                        week_start_day = EXCLUDED.week_start_day,
                        default_rate_nanos = EXCLUDED.default_rate_nanos,
                        interest_bookkeeping = EXCLUDED.interest_bookkeeping,
                        auto_allocate = EXCLUDED.auto_allocate,
                        auto_repay = EXCLUDED.auto_repay,
                        auto_repay_share_nanos = EXCLUDED.auto_repay_share_nanos,
                        auto_repay_threshold_units = EXCLUDED.auto_repay_threshold_units,
                        auto_repay_threshold_nano = EXCLUDED.auto_repay_threshold_nano,
                        utc_offset_minutes = EXCLUDED.utc_offset_minutes,
                        epoch = EXCLUDED.epoch
                )",
                settings.ownerId,
                settings.weekStartDay,
                settings.defaultInterestRate.nanos,
                domain::toString(settings.interestBookkeeping),
                settings.autoAllocate,
                settings.autoRepay,
                settings.autoRepayShare.nanos,
                settings.autoRepayThreshold.units,
                settings.autoRepayThreshold.nano,
                settings.utcOffsetMinutes,
                epoch
            );

            txn.commit();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresSettingsRepository] save() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;

    void initSchema() {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS ledger_owner_settings (
                    owner_id VARCHAR(64) PRIMARY KEY,
                    week_start_day INTEGER NOT NULL DEFAULT 0,
                    default_rate_nanos BIGINT NOT NULL,
                    interest_bookkeeping VARCHAR(32) NOT NULL,
                    auto_allocate BOOLEAN NOT NULL DEFAULT TRUE,
                    auto_repay BOOLEAN NOT NULL DEFAULT FALSE,
                    auto_repay_share_nanos BIGINT NOT NULL,
                    auto_repay_threshold_units BIGINT NOT NULL,
                    auto_repay_threshold_nano INTEGER NOT NULL,
                    utc_offset_minutes INTEGER NOT NULL DEFAULT 0,
                    epoch DATE
                )
            )");

            txn.exec(R"(
                ALTER TABLE ledger_owner_settings
                    ADD COLUMN IF NOT EXISTS utc_offset_minutes INTEGER NOT NULL DEFAULT 0
            )");

            txn.commit();
            std::cout << "[PostgresSettingsRepository] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresSettingsRepository] initSchema error: " << e.what() << std::endl;
            throw;
        }
    }
};

} // namespace budget::adapters::secondary
