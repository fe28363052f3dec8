#include "LedgerApp.hpp"

#include <IEnvironment.hpp>

// Handlers (Primary Adapters)
#include "adapters/primary/AccountHandler.hpp"
#include "adapters/primary/PeriodHandler.hpp"
#include "adapters/primary/TransactionHandler.hpp"
#include "adapters/primary/TemplateHandler.hpp"
#include "adapters/primary/AllocationHandler.hpp"
#include "adapters/primary/LoanHandler.hpp"
#include "adapters/primary/IntegrityHandler.hpp"
#include "adapters/primary/WeeklyRunHandler.hpp"
#include "adapters/primary/SettingsHandler.hpp"
#include "adapters/primary/HealthHandler.hpp"

// Application Services
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

// Secondary Adapters
#include "adapters/secondary/settings/LedgerSettings.hpp"
#include "adapters/secondary/settings/DbSettings.hpp"
#include "adapters/secondary/persistence/InMemoryAccountRepository.hpp"
#include "adapters/secondary/persistence/InMemoryTransactionRepository.hpp"
#include "adapters/secondary/persistence/InMemoryPeriodRepository.hpp"
#include "adapters/secondary/persistence/InMemoryTemplateRepository.hpp"
#include "adapters/secondary/persistence/InMemoryAllocationRepository.hpp"
#include "adapters/secondary/persistence/InMemoryLoanRepository.hpp"
#include "adapters/secondary/persistence/InMemorySettingsRepository.hpp"
#include "adapters/secondary/persistence/PostgresAccountRepository.hpp"
#include "adapters/secondary/persistence/PostgresTransactionRepository.hpp"
#include "adapters/secondary/persistence/PostgresPeriodRepository.hpp"
#include "adapters/secondary/persistence/PostgresTemplateRepository.hpp"
#include "adapters/secondary/persistence/PostgresAllocationRepository.hpp"
#include "adapters/secondary/persistence/PostgresLoanRepository.hpp"
#include "adapters/secondary/persistence/PostgresSettingsRepository.hpp"

#include <OwnerLockRegistry.hpp>

#include <iostream>

namespace di = boost::di;

namespace output = budget::ports::output;
namespace input = budget::ports::input;
namespace secondary = budget::adapters::secondary;
namespace primary = budget::adapters::primary;

// ============================================================================
// LedgerApp Implementation
// ============================================================================

LedgerApp::LedgerApp()
{
    std::cout << "[LedgerApp] Application created" << std::endl;
}

LedgerApp::~LedgerApp()
{
    std::cout << "[LedgerApp] Application destroyed" << std::endl;
}

void LedgerApp::loadEnvironment(int argc, char* argv[])
{
    std::cout << "[LedgerApp] Loading environment..." << std::endl;

    BoostBeastApplication::loadEnvironment(argc, argv);

    std::cout << "[LedgerApp] Environment loaded successfully" << std::endl;
}

void LedgerApp::configureInjection()
{
    printStartupBanner();

    auto ledgerSettings = std::make_shared<secondary::LedgerSettings>(env_);

    // ========================================================================
    // Storage: репозитории создаются заранее, выбор по ledger.storage
    // ========================================================================

    std::shared_ptr<output::IAccountRepository> accountRepository;
    std::shared_ptr<output::ITransactionRepository> transactionRepository;
    std::shared_ptr<output::IPeriodRepository> periodRepository;
    std::shared_ptr<output::ITemplateRepository> templateRepository;
    std::shared_ptr<output::IAllocationRepository> allocationRepository;
    std::shared_ptr<output::ILoanRepository> loanRepository;
    std::shared_ptr<output::ISettingsRepository> settingsRepository;

    if (ledgerSettings->getStorage() == "postgres") {
        std::cout << "[LedgerApp] Storage: PostgreSQL" << std::endl;

        auto db = std::make_shared<secondary::DbSettings>();
        accountRepository = std::make_shared<secondary::PostgresAccountRepository>(db);
        transactionRepository = std::make_shared<secondary::PostgresTransactionRepository>(db);
        periodRepository = std::make_shared<secondary::PostgresPeriodRepository>(db);
        templateRepository = std::make_shared<secondary::PostgresTemplateRepository>(db);
        allocationRepository = std::make_shared<secondary::PostgresAllocationRepository>(db);
        loanRepository = std::make_shared<secondary::PostgresLoanRepository>(db);
        settingsRepository = std::make_shared<secondary::PostgresSettingsRepository>(db);
    } else {
        std::cout << "[LedgerApp] Storage: in-memory" << std::endl;

        accountRepository = std::make_shared<secondary::InMemoryAccountRepository>();
        transactionRepository = std::make_shared<secondary::InMemoryTransactionRepository>();
        periodRepository = std::make_shared<secondary::InMemoryPeriodRepository>();
        templateRepository = std::make_shared<secondary::InMemoryTemplateRepository>();
        allocationRepository = std::make_shared<secondary::InMemoryAllocationRepository>();
        loanRepository = std::make_shared<secondary::InMemoryLoanRepository>();
        settingsRepository = std::make_shared<secondary::InMemorySettingsRepository>();
    }

    std::cout << "[LedgerApp] Configuring Boost.DI injection..." << std::endl;

    auto injector = di::make_injector(

        // ====================================================================
        // Layer 1: Secondary Adapters (Output Ports implementations)
        // ====================================================================

        di::bind<IEnvironment>().to(env_),
        di::bind<output::ILedgerSettings>().to(
            std::static_pointer_cast<output::ILedgerSettings>(ledgerSettings)),

        di::bind<output::IAccountRepository>().to(accountRepository),
        di::bind<output::ITransactionRepository>().to(transactionRepository),
        di::bind<output::IPeriodRepository>().to(periodRepository),
        di::bind<output::ITemplateRepository>().to(templateRepository),
        di::bind<output::IAllocationRepository>().to(allocationRepository),
        di::bind<output::ILoanRepository>().to(loanRepository),
        di::bind<output::ISettingsRepository>().to(settingsRepository),

        // Общие для всех сервисов: блокировки владельцев и проводки
        di::bind<OwnerLockRegistry>().in(di::singleton),
        di::bind<budget::application::LedgerPosting>().in(di::singleton),

        // ====================================================================
        // Layer 2: Application Services (Input Ports implementations)
        // ====================================================================

        di::bind<input::IOwnerSettingsService>()
            .to<budget::application::OwnerSettingsService>()
            .in(di::singleton),

        di::bind<input::IAccountService>()
            .to<budget::application::AccountService>()
            .in(di::singleton),

        di::bind<input::IPeriodService>()
            .to<budget::application::PeriodService>()
            .in(di::singleton),

        di::bind<input::ILedgerService>()
            .to<budget::application::LedgerService>()
            .in(di::singleton),

        di::bind<input::ITemplateService>()
            .to<budget::application::TemplateService>()
            .in(di::singleton),

        di::bind<input::IAllocationService>()
            .to<budget::application::AllocationService>()
            .in(di::singleton),

        di::bind<input::ILoanService>()
            .to<budget::application::LoanService>()
            .in(di::singleton),

        di::bind<input::IIntegrityService>()
            .to<budget::application::IntegrityService>()
            .in(di::singleton),

        di::bind<input::IWeeklyBudgetProcessor>()
            .to<budget::application::WeeklyBudgetProcessor>()
            .in(di::singleton));

    std::cout << "\n📦 Boost.DI Injector configured:" << std::endl;
    std::cout << "  ✓ Secondary Adapters (9 bindings)" << std::endl;
    std::cout << "  ✓ Application Services (9 bindings)" << std::endl;

    // ========================================================================
    // Layer 3: Primary Adapters (HTTP Handlers)
    // ========================================================================

    std::cout << "\n🎮 Registering HTTP Handlers via DI..." << std::endl;

    {
        auto handler = injector.create<std::shared_ptr<primary::AccountHandler>>();
        handlers_[getHandlerKey("POST", "/api/v1/accounts")] = handler;
        handlers_[getHandlerKey("GET", "/api/v1/accounts")] = handler;
        handlers_[getHandlerKey("POST", "/api/v1/accounts/defaults")] = handler;
        handlers_[getHandlerKey("GET", "/api/v1/accounts/*")] = handler;
        handlers_[getHandlerKey("DELETE", "/api/v1/accounts/*")] = handler;
        handlers_[getHandlerKey("PUT", "/api/v1/accounts/*/parent")] = handler;
        handlers_[getHandlerKey("PUT", "/api/v1/accounts/*/name")] = handler;
        handlers_[getHandlerKey("POST", "/api/v1/accounts/*/deactivate")] = handler;
        handlers_[getHandlerKey("POST", "/api/v1/accounts/*/activate")] = handler;
        handlers_[getHandlerKey("GET", "/api/v1/accounts/*/balance")] = handler;
        handlers_[getHandlerKey("GET", "/api/v1/accounts/*/transactions")] = handler;
        handlers_[getHandlerKey("GET", "/api/v1/accounts/*/history")] = handler;
        std::cout << "  ✓ AccountHandler: /api/v1/accounts" << std::endl;
    }

    {
        auto handler = injector.create<std::shared_ptr<primary::PeriodHandler>>();
        handlers_[getHandlerKey("POST", "/api/v1/periods/open")] = handler;
        handlers_[getHandlerKey("GET", "/api/v1/periods/current")] = handler;
        handlers_[getHandlerKey("GET", "/api/v1/periods")] = handler;
        handlers_[getHandlerKey("GET", "/api/v1/periods/*")] = handler;
        std::cout << "  ✓ PeriodHandler: /api/v1/periods" << std::endl;
    }

    {
        auto handler = injector.create<std::shared_ptr<primary::TransactionHandler>>();
        handlers_[getHandlerKey("POST", "/api/v1/transactions")] = handler;
        handlers_[getHandlerKey("GET", "/api/v1/transactions/*")] = handler;
        handlers_[getHandlerKey("POST", "/api/v1/transactions/*/reverse")] = handler;
        handlers_[getHandlerKey("POST", "/api/v1/transfers")] = handler;
        handlers_[getHandlerKey("POST", "/api/v1/balances/recompute")] = handler;
        std::cout << "  ✓ TransactionHandler: /api/v1/transactions, /api/v1/transfers" << std::endl;
    }

    {
        auto handler = injector.create<std::shared_ptr<primary::TemplateHandler>>();
        handlers_[getHandlerKey("POST", "/api/v1/templates")] = handler;
        handlers_[getHandlerKey("GET", "/api/v1/templates")] = handler;
        handlers_[getHandlerKey("GET", "/api/v1/templates/*")] = handler;
        handlers_[getHandlerKey("PUT", "/api/v1/templates/*")] = handler;
        handlers_[getHandlerKey("DELETE", "/api/v1/templates/*")] = handler;
        std::cout << "  ✓ TemplateHandler: /api/v1/templates" << std::endl;
    }

    {
        auto handler = injector.create<std::shared_ptr<primary::AllocationHandler>>();
        handlers_[getHandlerKey("POST", "/api/v1/allocations/run")] = handler;
        handlers_[getHandlerKey("POST", "/api/v1/allocations")] = handler;
        handlers_[getHandlerKey("GET", "/api/v1/allocations")] = handler;
        std::cout << "  ✓ AllocationHandler: /api/v1/allocations" << std::endl;
    }

    {
        auto handler = injector.create<std::shared_ptr<primary::LoanHandler>>();
        handlers_[getHandlerKey("POST", "/api/v1/loans")] = handler;
        handlers_[getHandlerKey("GET", "/api/v1/loans")] = handler;
        handlers_[getHandlerKey("POST", "/api/v1/loans/accrue")] = handler;
        handlers_[getHandlerKey("GET", "/api/v1/loans/*")] = handler;
        handlers_[getHandlerKey("GET", "/api/v1/loans/*/payments")] = handler;
        handlers_[getHandlerKey("POST", "/api/v1/loans/*/repay")] = handler;
        handlers_[getHandlerKey("POST", "/api/v1/loans/*/accrue")] = handler;
        std::cout << "  ✓ LoanHandler: /api/v1/loans" << std::endl;
    }

    {
        auto handler = injector.create<std::shared_ptr<primary::IntegrityHandler>>();
        handlers_[getHandlerKey("GET", "/api/v1/integrity")] = handler;
        std::cout << "  ✓ IntegrityHandler: GET /api/v1/integrity" << std::endl;
    }

    {
        auto handler = injector.create<std::shared_ptr<primary::WeeklyRunHandler>>();
        handlers_[getHandlerKey("POST", "/api/v1/weekly-run")] = handler;
        std::cout << "  ✓ WeeklyRunHandler: POST /api/v1/weekly-run" << std::endl;
    }

    {
        auto handler = injector.create<std::shared_ptr<primary::SettingsHandler>>();
        handlers_[getHandlerKey("GET", "/api/v1/settings")] = handler;
        handlers_[getHandlerKey("PUT", "/api/v1/settings")] = handler;
        std::cout << "  ✓ SettingsHandler: GET/PUT /api/v1/settings" << std::endl;
    }

    {
        auto handler = injector.create<std::shared_ptr<primary::HealthHandler>>();
        handlers_[getHandlerKey("GET", "/api/v1/health")] = handler;
        std::cout << "  ✓ HealthHandler: GET /api/v1/health" << std::endl;
    }

    std::cout << "\n[LedgerApp] DI configuration completed - "
              << handlers_.size() << " routes registered" << std::endl;
}

void LedgerApp::printStartupBanner()
{
    std::cout << std::endl;
    std::cout << "╔══════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║          Budget Ledger - Allocation Service          ║" << std::endl;
    std::cout << "║                                                      ║" << std::endl;
    std::cout << "║  Architecture: Hexagonal (Ports & Adapters)          ║" << std::endl;
    std::cout << "║  DI Framework: Boost.DI                              ║" << std::endl;
    std::cout << "║  HTTP Server:  Boost.Beast                           ║" << std::endl;
    std::cout << "║  Storage:      in-memory / PostgreSQL (libpqxx)      ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════════════════╝" << std::endl;
    std::cout << std::endl;
}
