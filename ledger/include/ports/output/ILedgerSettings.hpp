// include/ports/output/ILedgerSettings.hpp
#pragma once

#include "domain/enums/InterestBookkeeping.hpp"
#include "domain/Money.hpp"
#include "domain/Rate.hpp"
#include <string>

namespace budget::ports::output {

/**
 * @brief Настройки ledger уровня приложения
 *
 * Значения по умолчанию для владельцев без собственных настроек.
 * Реализация получает значения из IEnvironment.
 */
class ILedgerSettings {
public:
    virtual ~ILedgerSettings() = default;

    /// 0 = понедельник
    virtual int getWeekStartDay() const = 0;

    virtual domain::Rate getDefaultInterestRate() const = 0;

    virtual domain::InterestBookkeeping getInterestBookkeeping() const = 0;

    virtual bool isAutoAllocateEnabled() const = 0;

    virtual bool isAutoRepayEnabled() const = 0;

    /// Доля баланса заёмщика для автопогашения
    virtual domain::Rate getAutoRepayShare() const = 0;

    /// Минимальная сумма автопогашения
    virtual domain::Money getAutoRepayThreshold() const = 0;

    /// "memory" или "postgres"
    virtual std::string getStorage() const = 0;
};

} // namespace budget::ports::output
