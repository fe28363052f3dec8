#pragma once

#include <BoostBeastApplication.hpp>
#include <IHttpHandler.hpp>
#include <boost/di.hpp>
#include <memory>

// Forward declarations - Ports
namespace budget::ports::input {
    class IAccountService;
    class IPeriodService;
    class ILedgerService;
    class ITemplateService;
    class IAllocationService;
    class ILoanService;
    class IIntegrityService;
    class IOwnerSettingsService;
    class IWeeklyBudgetProcessor;
}

namespace budget::ports::output {
    class ILedgerSettings;
    class IAccountRepository;
    class ITransactionRepository;
    class IPeriodRepository;
    class ITemplateRepository;
    class IAllocationRepository;
    class ILoanRepository;
    class ISettingsRepository;
}

/**
 * @class LedgerApp
 * @brief Сервис бюджетного учёта (ledger)
 *
 * Наследует BoostBeastApplication с Template Method паттерном:
 * 1. loadEnvironment() - загрузка config.json в Environment
 * 2. configureInjection() - выбор хранилища, Boost.DI и регистрация handlers
 * 3. start() - запуск HTTP сервера (из базового класса)
 *
 * Хранилище выбирается ключом ledger.storage: memory или postgres.
 */
class LedgerApp : public BoostBeastApplication
{
public:
    LedgerApp();
    ~LedgerApp() override;

protected:
    void loadEnvironment(int argc, char* argv[]) override;

    /**
     * @brief Настроить Boost.DI контейнер и зарегистрировать handlers
     *
     * 1. Репозитории (in-memory или PostgreSQL) создаются до инжектора
     *    и передаются в него как готовые экземпляры
     * 2. Input Ports биндятся к Application Services
     * 3. Primary Adapters (Handlers) создаются инжектором
     */
    void configureInjection() override;

private:
    void printStartupBanner();
};
