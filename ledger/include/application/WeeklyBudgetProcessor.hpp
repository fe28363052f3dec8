#pragma once

#include "ports/input/IWeeklyBudgetProcessor.hpp"
#include "ports/input/IAccountService.hpp"
#include "ports/input/IAllocationService.hpp"
#include "ports/input/ILedgerService.hpp"
#include "ports/input/ILoanService.hpp"
#include "ports/input/IOwnerSettingsService.hpp"
#include "ports/input/IPeriodService.hpp"
#include "domain/LedgerError.hpp"
#include <iostream>
#include <memory>

namespace budget::application {

/**
 * @brief Еженедельная обработка владельца
 *
 * Собирает шаги из входных портов: текущий период, распределение дохода
 * за период, начисление процентов, автопогашения. Сам блокировок не берёт,
 * каждый шаг блокирует владельца внутри своего сервиса.
 *
 * Ошибка шага не прерывает остальные шаги и попадает в отчёт.
 */
class WeeklyBudgetProcessor : public ports::input::IWeeklyBudgetProcessor {
public:
    WeeklyBudgetProcessor(
        std::shared_ptr<ports::input::IPeriodService> periodService,
        std::shared_ptr<ports::input::IOwnerSettingsService> settingsService,
        std::shared_ptr<ports::input::IAccountService> accountService,
        std::shared_ptr<ports::input::ILedgerService> ledgerService,
        std::shared_ptr<ports::input::IAllocationService> allocationService,
        std::shared_ptr<ports::input::ILoanService> loanService
    ) : periodService_(std::move(periodService))
      , settingsService_(std::move(settingsService))
      , accountService_(std::move(accountService))
      , ledgerService_(std::move(ledgerService))
      , allocationService_(std::move(allocationService))
      , loanService_(std::move(loanService))
    {
        std::cout << "[WeeklyBudgetProcessor] Created" << std::endl;
    }

    domain::WeeklyRunReport process(
        const std::string& ownerId,
        const domain::Date& date,
        const ports::input::WeeklyRunOptions& options
    ) override {
        domain::WeeklyRunReport report;
        report.ownerId = ownerId;
        report.date = date;

        auto period = periodService_->currentPeriod(ownerId, date);
        report.periodId = period.id;
        auto settings = settingsService_->getSettings(ownerId);

        std::cout << "[WeeklyBudgetProcessor] Processing owner " << ownerId
                  << ", period " << period.startDate.toString() << std::endl;

        if (settings.autoAllocate) {
            try {
                allocate(report, ownerId, period, options);
            } catch (const domain::LedgerException& e) {
                std::cerr << "[WeeklyBudgetProcessor] Allocation failed: " << e.what() << std::endl;
                report.errors.push_back(std::string("Allocation: ") + e.what());
            }
        } else {
            report.allocationSkippedReason = "Auto-allocation is disabled";
        }

        try {
            auto accrual = loanService_->accrueAll(ownerId, period.id);
            report.loansAccrued = static_cast<int>(accrual.accrued.size());
            report.interestAccrued = accrual.totalInterest;
            report.errors.insert(report.errors.end(), accrual.errors.begin(), accrual.errors.end());
        } catch (const domain::LedgerException& e) {
            std::cerr << "[WeeklyBudgetProcessor] Interest accrual failed: " << e.what() << std::endl;
            report.errors.push_back(std::string("Interest accrual: ") + e.what());
        }

        if (settings.autoRepay) {
            try {
                auto repayments = loanService_->autoRepay(ownerId, period.id);
                report.repaymentsMade = static_cast<int>(repayments.payments.size());
                report.totalRepaid = repayments.totalRepaid;
                report.errors.insert(report.errors.end(), repayments.errors.begin(), repayments.errors.end());
            } catch (const domain::LedgerException& e) {
                std::cerr << "[WeeklyBudgetProcessor] Auto-repay failed: " << e.what() << std::endl;
                report.errors.push_back(std::string("Auto-repay: ") + e.what());
            }
        }

        std::cout << "[WeeklyBudgetProcessor] Done for owner " << ownerId
                  << ": allocated " << (report.allocation ? report.allocation->totalAllocated.toString() : "0.00")
                  << ", interest " << report.interestAccrued.toString()
                  << ", repaid " << report.totalRepaid.toString()
                  << ", errors " << report.errors.size() << std::endl;
        return report;
    }

private:
    std::shared_ptr<ports::input::IPeriodService> periodService_;
    std::shared_ptr<ports::input::IOwnerSettingsService> settingsService_;
    std::shared_ptr<ports::input::IAccountService> accountService_;
    std::shared_ptr<ports::input::ILedgerService> ledgerService_;
    std::shared_ptr<ports::input::IAllocationService> allocationService_;
    std::shared_ptr<ports::input::ILoanService> loanService_;

    void allocate(domain::WeeklyRunReport& report,
                  const std::string& ownerId,
                  const domain::WeeklyPeriod& period,
                  const ports::input::WeeklyRunOptions& options) {
        auto sourceId = options.sourceAccountId ? options.sourceAccountId : findIncomeSource(ownerId);
        if (!sourceId) {
            report.allocationSkippedReason = "No active income account";
            return;
        }

        // Пул - чистый доход на счёте-источнике за период; переводы не учитываются
        domain::Money pool;
        domain::PeriodRange range{period.startDate, period.endDate};
        for (const auto& transaction : ledgerService_->history(ownerId, *sourceId, range)) {
            if (domain::countsTowardPool(transaction.kind)) {
                pool += transaction.amount;
            }
        }

        if (!pool.isPositive()) {
            report.allocationSkippedReason = "No income to allocate (pool " + pool.toString() + ")";
            return;
        }

        domain::AllocationRunRequest request;
        request.periodId = period.id;
        request.sourceAccountId = *sourceId;
        request.pool = pool;
        request.reprocess = options.force;
        report.allocation = allocationService_->runAllocation(ownerId, request);
    }

    /**
     * @brief Первый активный корневой INCOME счёт, иначе первый активный INCOME верхнего уровня
     */
    std::optional<std::string> findIncomeSource(const std::string& ownerId) {
        auto accounts = accountService_->getAccounts(ownerId);
        std::optional<std::string> fallback;
        for (const auto& account : accounts) {
            if (!account.active || account.category != domain::AccountCategory::INCOME || !account.isTopLevel()) {
                continue;
            }
            if (account.isRoot) {
                return account.id;
            }
            if (!fallback) {
                fallback = account.id;
            }
        }
        return fallback;
    }
};

} // namespace budget::application
