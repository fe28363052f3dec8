#pragma once

#include "ports/input/IPeriodService.hpp"
#include "ports/input/IOwnerSettingsService.hpp"
#include "ports/output/IPeriodRepository.hpp"
#include "domain/LedgerError.hpp"
#include "utils/UuidGenerator.hpp"
#include <OwnerLockRegistry.hpp>
#include <iostream>
#include <memory>

namespace budget::application {

/**
 * @brief Менеджер недельных периодов
 *
 * Периоды владельца идут подряд без разрывов начиная с первого.
 * Недостающие периоды достраиваются при запросе текущего периода
 * и сохраняются одной пачкой.
 */
class PeriodService : public ports::input::IPeriodService {
public:
    PeriodService(
        std::shared_ptr<ports::output::IPeriodRepository> periodRepository,
        std::shared_ptr<ports::input::IOwnerSettingsService> settingsService,
        std::shared_ptr<OwnerLockRegistry> locks
    ) : periodRepository_(std::move(periodRepository))
      , settingsService_(std::move(settingsService))
      , locks_(std::move(locks))
    {
        std::cout << "[PeriodService] Created" << std::endl;
    }

    domain::WeeklyPeriod openLedger(const std::string& ownerId, const domain::Date& epoch) override {
        auto lock = locks_->lockExclusive(ownerId);

        if (auto first = periodRepository_->findEarliest(ownerId)) {
            return *first;
        }

        auto settings = settingsService_->getSettings(ownerId);
        settings.epoch = epoch;
        settingsService_->updateSettings(settings);

        domain::WeeklyPeriod period(
            utils::UuidGenerator::generate(), ownerId, epoch.startOfWeek(settings.weekStartDay));
        periodRepository_->saveAll({period});

        std::cout << "[PeriodService] Ledger opened for owner " << ownerId
                  << ", first period " << period.startDate.toString() << std::endl;
        return period;
    }

    domain::WeeklyPeriod currentPeriod(const std::string& ownerId, const domain::Date& now) override {
        {
            auto lock = locks_->lockShared(ownerId);
            if (auto found = periodRepository_->findContaining(ownerId, now)) {
                return *found;
            }
        }

        auto lock = locks_->lockExclusive(ownerId);
        // Период мог появиться, пока блокировка была отпущена
        if (auto found = periodRepository_->findContaining(ownerId, now)) {
            return *found;
        }

        auto earliest = periodRepository_->findEarliest(ownerId);
        auto latest = periodRepository_->findLatest(ownerId);

        std::vector<domain::WeeklyPeriod> created;
        domain::Date nextStart;
        if (!latest) {
            auto settings = settingsService_->getSettings(ownerId);
            if (!settings.epoch) {
                throw domain::PeriodGapError("Owner " + ownerId + " has no periods and no epoch");
            }
            nextStart = settings.epoch->startOfWeek(settings.weekStartDay);
        } else {
            if (now < earliest->startDate) {
                throw domain::PeriodGapError(
                    "Date " + now.toString() + " precedes the first period " + earliest->startDate.toString());
            }
            nextStart = latest->endDate;
        }

        if (now < nextStart) {
            throw domain::PeriodGapError(
                "Date " + now.toString() + " precedes the first period " + nextStart.toString());
        }

        while (true) {
            domain::WeeklyPeriod period(utils::UuidGenerator::generate(), ownerId, nextStart);
            created.push_back(period);
            if (period.contains(now)) {
                break;
            }
            nextStart = period.endDate;
        }

        periodRepository_->saveAll(created);
        std::cout << "[PeriodService] Created " << created.size() << " period(s) for owner " << ownerId
                  << " up to " << created.back().endDate.toString() << std::endl;
        return created.back();
    }

    Sequence<domain::WeeklyPeriod> periodsInRange(
        const std::string& ownerId,
        const domain::Date& start,
        const domain::Date& end
    ) override {
        auto repository = periodRepository_;
        auto locks = locks_;

        // Каждый проход заново читает хранилище: новые периоды видны при повторном обходе
        return Sequence<domain::WeeklyPeriod>([repository, locks, ownerId, start, end]() {
            auto cursor = std::make_shared<std::optional<domain::Date>>();
            auto started = std::make_shared<bool>(false);

            return Sequence<domain::WeeklyPeriod>::Generator(
                [repository, locks, ownerId, start, end, cursor, started]() -> std::optional<domain::WeeklyPeriod> {
                    auto lock = locks->lockShared(ownerId);

                    if (!*started) {
                        *started = true;
                        auto earliest = repository->findEarliest(ownerId);
                        if (!earliest || !(start < end)) {
                            return std::nullopt;
                        }
                        domain::Date first = earliest->startDate;
                        if (first < start) {
                            // Период, содержащий start, начинается не позже него
                            int64_t weeks = first.daysUntil(start) / domain::WeeklyPeriod::LENGTH_DAYS;
                            first = first.addDays(weeks * domain::WeeklyPeriod::LENGTH_DAYS);
                        }
                        *cursor = first;
                    }

                    if (!cursor->has_value() || !(**cursor < end)) {
                        return std::nullopt;
                    }

                    auto period = repository->findByStart(ownerId, **cursor);
                    if (!period) {
                        cursor->reset();
                        return std::nullopt;
                    }
                    *cursor = period->endDate;
                    return period;
                });
        });
    }

    std::optional<domain::WeeklyPeriod> getPeriod(const std::string& ownerId, const std::string& periodId) override {
        auto lock = locks_->lockShared(ownerId);

        auto period = periodRepository_->findById(periodId);
        if (!period || period->ownerId != ownerId) {
            return std::nullopt;
        }
        return period;
    }

    std::vector<domain::WeeklyPeriod> listPeriods(const std::string& ownerId) override {
        auto lock = locks_->lockShared(ownerId);
        return periodRepository_->findByOwner(ownerId);
    }

private:
    std::shared_ptr<ports::output::IPeriodRepository> periodRepository_;
    std::shared_ptr<ports::input::IOwnerSettingsService> settingsService_;
    std::shared_ptr<OwnerLockRegistry> locks_;
};

} // namespace budget::application
