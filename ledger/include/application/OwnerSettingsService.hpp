#pragma once

#include "ports/input/IOwnerSettingsService.hpp"
#include "ports/output/ISettingsRepository.hpp"
#include "ports/output/ILedgerSettings.hpp"
#include "domain/LedgerError.hpp"
#include <iostream>
#include <memory>

namespace budget::application {

/**
 * @brief Сервис настроек владельца
 *
 * Хранилище настроек само по себе потокобезопасно, поэтому блокировку
 * владельца сервис не берёт и может вызываться из-под неё.
 */
class OwnerSettingsService : public ports::input::IOwnerSettingsService {
public:
    OwnerSettingsService(
        std::shared_ptr<ports::output::ISettingsRepository> repository,
        std::shared_ptr<ports::output::ILedgerSettings> defaults
    ) : repository_(std::move(repository))
      , defaults_(std::move(defaults))
    {}

    domain::OwnerSettings getSettings(const std::string& ownerId) override {
        if (auto stored = repository_->find(ownerId)) {
            return *stored;
        }

        domain::OwnerSettings settings;
        settings.ownerId = ownerId;
        settings.weekStartDay = defaults_->getWeekStartDay();
        settings.defaultInterestRate = defaults_->getDefaultInterestRate();
        settings.interestBookkeeping = defaults_->getInterestBookkeeping();
        settings.autoAllocate = defaults_->isAutoAllocateEnabled();
        settings.autoRepay = defaults_->isAutoRepayEnabled();
        settings.autoRepayShare = defaults_->getAutoRepayShare();
        settings.autoRepayThreshold = defaults_->getAutoRepayThreshold();
        return settings;
    }

    domain::OwnerSettings updateSettings(const domain::OwnerSettings& settings) override {
        if (settings.ownerId.empty()) {
            throw domain::InvalidArgument("Owner id is required");
        }
        if (settings.weekStartDay < 0 || settings.weekStartDay > 6) {
            throw domain::InvalidArgument("Week start day must be within 0..6");
        }
        if (settings.defaultInterestRate.isNegative()) {
            throw domain::InvalidArgument("Default interest rate must not be negative");
        }
        if (settings.autoRepayShare.isNegative() || settings.autoRepayShare > domain::Rate::fromString("1")) {
            throw domain::InvalidArgument("Auto-repay share must be within [0, 1]");
        }
        if (settings.autoRepayThreshold.isNegative()) {
            throw domain::InvalidArgument("Auto-repay threshold must not be negative");
        }
        if (settings.utcOffsetMinutes < MIN_UTC_OFFSET || settings.utcOffsetMinutes > MAX_UTC_OFFSET) {
            throw domain::InvalidArgument("UTC offset must be within -720..840 minutes");
        }

        repository_->save(settings);
        std::cout << "[OwnerSettingsService] Settings saved for owner " << settings.ownerId << std::endl;
        return settings;
    }

    domain::Date today(const std::string& ownerId) override {
        return domain::Date::today(getSettings(ownerId).utcOffsetMinutes);
    }

private:
    static constexpr int MIN_UTC_OFFSET = -12 * 60;
    static constexpr int MAX_UTC_OFFSET = 14 * 60;

    std::shared_ptr<ports::output::ISettingsRepository> repository_;
    std::shared_ptr<ports::output::ILedgerSettings> defaults_;
};

} // namespace budget::application
