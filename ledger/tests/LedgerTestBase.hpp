#pragma once

#include <gtest/gtest.h>

#include "application/LedgerPosting.hpp"
#include "application/OwnerSettingsService.hpp"
#include "application/AccountService.hpp"
#include "application/PeriodService.hpp"
#include "application/LedgerService.hpp"
#include "application/TemplateService.hpp"
#include "application/AllocationService.hpp"
#include "application/LoanService.hpp"
#include "application/IntegrityService.hpp"
#include "application/WeeklyBudgetProcessor.hpp"

#include "adapters/secondary/persistence/InMemoryAccountRepository.hpp"
#include "adapters/secondary/persistence/InMemoryTransactionRepository.hpp"
#include "adapters/secondary/persistence/InMemoryPeriodRepository.hpp"
#include "adapters/secondary/persistence/InMemoryTemplateRepository.hpp"
#include "adapters/secondary/persistence/InMemoryAllocationRepository.hpp"
#include "adapters/secondary/persistence/InMemoryLoanRepository.hpp"
#include "adapters/secondary/persistence/InMemorySettingsRepository.hpp"

#include "mocks/FakeLedgerSettings.hpp"

#include <OwnerLockRegistry.hpp>

namespace budget::tests {

/**
 * @brief Общая фикстура: все сервисы ledger поверх in-memory хранилищ
 *
 * Владелец OWNER получает открытый ledger с эпохой 2024-01-01 (понедельник),
 * счета по умолчанию и пару счетов расходов.
 */
class LedgerTestBase : public ::testing::Test {
protected:
    static constexpr const char* OWNER = "family-1";

    void SetUp() override {
        settings_ = std::make_shared<mocks::FakeLedgerSettings>();
        locks_ = std::make_shared<OwnerLockRegistry>();

        accountRepo_ = std::make_shared<adapters::secondary::InMemoryAccountRepository>();
        transactionRepo_ = std::make_shared<adapters::secondary::InMemoryTransactionRepository>();
        periodRepo_ = std::make_shared<adapters::secondary::InMemoryPeriodRepository>();
        templateRepo_ = std::make_shared<adapters::secondary::InMemoryTemplateRepository>();
        allocationRepo_ = std::make_shared<adapters::secondary::InMemoryAllocationRepository>();
        loanRepo_ = std::make_shared<adapters::secondary::InMemoryLoanRepository>();
        settingsRepo_ = std::make_shared<adapters::secondary::InMemorySettingsRepository>();

        buildServices(transactionRepo_);
    }

    /**
     * @brief Собрать сервисы поверх заданного журнала (для подмены в тестах отказов)
     */
    void buildServices(std::shared_ptr<ports::output::ITransactionRepository> transactions) {
        posting_ = std::make_shared<application::LedgerPosting>(accountRepo_, periodRepo_, transactions);
        settingsService_ = std::make_shared<application::OwnerSettingsService>(settingsRepo_, settings_);
        accountService_ = std::make_shared<application::AccountService>(accountRepo_, transactions, locks_);
        periodService_ = std::make_shared<application::PeriodService>(periodRepo_, settingsService_, locks_);
        ledgerService_ = std::make_shared<application::LedgerService>(posting_, accountRepo_, transactions, locks_);
        templateService_ = std::make_shared<application::TemplateService>(templateRepo_, accountRepo_, locks_);
        allocationService_ = std::make_shared<application::AllocationService>(
            posting_, templateRepo_, allocationRepo_, locks_);
        loanService_ = std::make_shared<application::LoanService>(posting_, loanRepo_, settingsService_, locks_);
        integrityService_ = std::make_shared<application::IntegrityService>(accountRepo_, posting_, locks_);
        processor_ = std::make_shared<application::WeeklyBudgetProcessor>(
            periodService_, settingsService_, accountService_, ledgerService_, allocationService_, loanService_);
    }

    // ------------------------------------------------------------------------
    // Helpers
    // ------------------------------------------------------------------------

    static domain::Money money(const char* value) {
        return domain::Money::fromString(value);
    }

    static domain::Date date(const char* iso) {
        return domain::Date::fromString(iso);
    }

    domain::WeeklyPeriod openLedger(const char* epoch = "2024-01-01") {
        return periodService_->openLedger(OWNER, date(epoch));
    }

    domain::Account createAccount(const std::string& name,
                                  domain::AccountCategory category,
                                  const std::optional<std::string>& parentId = std::nullopt) {
        domain::AccountRequest request;
        request.name = name;
        request.category = category;
        request.parentId = parentId;
        return accountService_->createAccount(OWNER, request);
    }

    /// Корневой счёт с заданным именем из setupDefaultAccounts
    domain::Account defaultRoot(const std::string& name) {
        for (const auto& account : accountService_->setupDefaultAccounts(OWNER)) {
            if (account.name == name) {
                return account;
            }
        }
        throw std::runtime_error("No default account " + name);
    }

    domain::Transaction postIncome(const std::string& accountId, const std::string& periodId, const char* amount) {
        domain::PostingRequest request;
        request.accountId = accountId;
        request.periodId = periodId;
        request.amount = money(amount);
        request.kind = domain::TransactionKind::INCOME;
        request.description = "Salary";
        return ledgerService_->post(OWNER, request);
    }

    domain::BudgetTemplate createTemplate(const std::string& destinationId,
                                          const domain::AllocationRule& rule,
                                          int priority = 0) {
        domain::TemplateRequest request;
        request.destinationAccountId = destinationId;
        request.rule = rule;
        request.priority = priority;
        return templateService_->createTemplate(OWNER, request);
    }

    /// Изменить сохранённые настройки владельца
    template <typename Mutator>
    void changeSettings(Mutator mutate) {
        auto settings = settingsService_->getSettings(OWNER);
        mutate(settings);
        settingsService_->updateSettings(settings);
    }

    domain::Money cached(const std::string& accountId) {
        return ledgerService_->getCachedBalance(OWNER, accountId);
    }

    std::shared_ptr<mocks::FakeLedgerSettings> settings_;
    std::shared_ptr<OwnerLockRegistry> locks_;

    std::shared_ptr<adapters::secondary::InMemoryAccountRepository> accountRepo_;
    std::shared_ptr<adapters::secondary::InMemoryTransactionRepository> transactionRepo_;
    std::shared_ptr<adapters::secondary::InMemoryPeriodRepository> periodRepo_;
    std::shared_ptr<adapters::secondary::InMemoryTemplateRepository> templateRepo_;
    std::shared_ptr<adapters::secondary::InMemoryAllocationRepository> allocationRepo_;
    std::shared_ptr<adapters::secondary::InMemoryLoanRepository> loanRepo_;
    std::shared_ptr<adapters::secondary::InMemorySettingsRepository> settingsRepo_;

    std::shared_ptr<application::LedgerPosting> posting_;
    std::shared_ptr<ports::input::IOwnerSettingsService> settingsService_;
    std::shared_ptr<ports::input::IAccountService> accountService_;
    std::shared_ptr<ports::input::IPeriodService> periodService_;
    std::shared_ptr<ports::input::ILedgerService> ledgerService_;
    std::shared_ptr<ports::input::ITemplateService> templateService_;
    std::shared_ptr<ports::input::IAllocationService> allocationService_;
    std::shared_ptr<ports::input::ILoanService> loanService_;
    std::shared_ptr<ports::input::IIntegrityService> integrityService_;
    std::shared_ptr<ports::input::IWeeklyBudgetProcessor> processor_;
};

} // namespace budget::tests
