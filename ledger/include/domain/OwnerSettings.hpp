#pragma once

#include "enums/InterestBookkeeping.hpp"
#include "Date.hpp"
#include "Money.hpp"
#include "Rate.hpp"
#include <optional>
#include <string>

namespace budget::domain {

/**
 * @brief Настройки бюджета владельца
 *
 * Если у владельца нет сохранённых настроек, берутся значения
 * по умолчанию из конфигурации приложения.
 */
struct OwnerSettings {
    std::string ownerId;
    int weekStartDay = 0;                       ///< 0 = понедельник
    Rate defaultInterestRate = Rate::fromNanos(20000000);   // 0.02
    InterestBookkeeping interestBookkeeping = InterestBookkeeping::CREDIT_LENDER;
    bool autoAllocate = true;
    bool autoRepay = false;
    Rate autoRepayShare = Rate::fromNanos(250000000);       // 0.25
    Money autoRepayThreshold = Money::fromCents(10000);     // 100.00
    int utcOffsetMinutes = 0;                   ///< Пояс владельца для "сегодня", минуты от UTC
    std::optional<Date> epoch;                  ///< Начало первого периода
};

} // namespace budget::domain
