// include/adapters/secondary/settings/LedgerSettings.hpp
#pragma once

#include "ports/output/ILedgerSettings.hpp"
#include <IEnvironment.hpp>
#include <memory>
#include <stdexcept>
#include <string>

namespace budget::adapters::secondary {

/**
 * @brief Реализация ILedgerSettings, получает данные из IEnvironment
 *
 * Ключи в config.json / Environment:
 * - ledger.storage                 (default: "memory")
 * - ledger.week_start_day          (default: 0, понедельник)
 * - ledger.default_interest_rate   (default: "0.02")
 * - ledger.interest_bookkeeping    (default: "CREDIT_LENDER")
 * - ledger.auto_allocate           (default: "true")
 * - ledger.auto_repay              (default: "false")
 * - ledger.auto_repay_share        (default: "0.25")
 * - ledger.auto_repay_threshold    (default: "100.00")
 *
 * Денежные значения и ставки задаются строками, чтобы не терять точность.
 */
class LedgerSettings : public ports::output::ILedgerSettings {
public:
    /**
     * @brief Конструктор с валидацией
     * @param env Окружение с настройками
     * @throws std::invalid_argument если значение не разобрано или вне допустимого диапазона
     */
    explicit LedgerSettings(std::shared_ptr<IEnvironment> env)
        : storage_(env->get<std::string>("ledger.storage", "memory"))
        , weekStartDay_(env->get<int>("ledger.week_start_day", 0))
        , defaultInterestRate_(domain::Rate::fromString(
              env->get<std::string>("ledger.default_interest_rate", "0.02")))
        , interestBookkeeping_(domain::interestBookkeepingFromString(
              env->get<std::string>("ledger.interest_bookkeeping", "CREDIT_LENDER")))
        , autoAllocate_(parseFlag(env->get<std::string>("ledger.auto_allocate", "true")))
        , autoRepay_(parseFlag(env->get<std::string>("ledger.auto_repay", "false")))
        , autoRepayShare_(domain::Rate::fromString(
              env->get<std::string>("ledger.auto_repay_share", "0.25")))
        , autoRepayThreshold_(domain::Money::fromString(
              env->get<std::string>("ledger.auto_repay_threshold", "100.00")))
    {
        if (weekStartDay_ < 0 || weekStartDay_ > 6) {
            throw std::invalid_argument("ledger.week_start_day must be within 0..6");
        }
        if (storage_ != "memory" && storage_ != "postgres") {
            throw std::invalid_argument("ledger.storage must be 'memory' or 'postgres': " + storage_);
        }
    }

    int getWeekStartDay() const override { return weekStartDay_; }
    domain::Rate getDefaultInterestRate() const override { return defaultInterestRate_; }
    domain::InterestBookkeeping getInterestBookkeeping() const override { return interestBookkeeping_; }
    bool isAutoAllocateEnabled() const override { return autoAllocate_; }
    bool isAutoRepayEnabled() const override { return autoRepay_; }
    domain::Rate getAutoRepayShare() const override { return autoRepayShare_; }
    domain::Money getAutoRepayThreshold() const override { return autoRepayThreshold_; }
    std::string getStorage() const override { return storage_; }

private:
    std::string storage_;
    int weekStartDay_;
    domain::Rate defaultInterestRate_;
    domain::InterestBookkeeping interestBookkeeping_;
    bool autoAllocate_;
    bool autoRepay_;
    domain::Rate autoRepayShare_;
    domain::Money autoRepayThreshold_;

    static bool parseFlag(const std::string& value) {
        if (value == "true" || value == "1") return true;
        if (value == "false" || value == "0") return false;
        throw std::invalid_argument("Invalid boolean value: " + value);
    }
};

} // namespace budget::adapters::secondary
