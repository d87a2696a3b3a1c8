#include "LedgerApp.hpp"

// Settings
#include "settings/LedgerSettings.hpp"
#include "settings/DbSettings.hpp"
#include "settings/MetricsSettings.hpp"

// Handlers (Primary Adapters)
#include "adapters/primary/AccountHandler.hpp"
#include "adapters/primary/JournalHandler.hpp"
#include "adapters/primary/FiscalYearHandler.hpp"
#include "adapters/primary/JournalEntryHandler.hpp"
#include "adapters/primary/BalanceHandler.hpp"
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/MetricsHandler.hpp"
#include "adapters/primary/MetricsDecoratorHandler.hpp"

// Application Services
#include "application/ChartOfAccountsService.hpp"
#include "application/JournalRegistryService.hpp"
#include "application/PeriodService.hpp"
#include "application/JournalService.hpp"
#include "application/BalanceService.hpp"
#include "application/ClosingService.hpp"
#include "application/MetricsService.hpp"
#include "application/PeriodGate.hpp"

// Secondary Adapters
#include "adapters/secondary/persistence/InMemoryAccountRepository.hpp"
#include "adapters/secondary/persistence/InMemoryJournalRepository.hpp"
#include "adapters/secondary/persistence/InMemoryPeriodRepository.hpp"
#include "adapters/secondary/persistence/InMemoryLedgerStore.hpp"
#include "adapters/secondary/persistence/PostgresAccountRepository.hpp"
#include "adapters/secondary/persistence/PostgresJournalRepository.hpp"
#include "adapters/secondary/persistence/PostgresPeriodRepository.hpp"
#include "adapters/secondary/persistence/PostgresLedgerStore.hpp"

#include <iostream>

namespace di = boost::di;

using namespace ledger;

namespace
{
    /**
     * @brief Input Ports → Application Services, общие для обоих хранилищ
     */
    auto applicationModule(const std::shared_ptr<settings::LedgerSettings>& ledgerSettings)
    {
        return di::make_injector(
            di::bind<settings::LedgerSettings>().to(ledgerSettings),

            di::bind<settings::IMetricsSettings>()
                .to<settings::MetricsSettings>()
                .in(di::singleton),

            di::bind<ports::input::IMetricsService>()
                .to<application::MetricsService>()
                .in(di::singleton),

            // Один набор блокировок периодов на процесс
            di::bind<application::PeriodGate>().in(di::singleton),

            di::bind<ports::input::IChartOfAccountsService>()
                .to<application::ChartOfAccountsService>()
                .in(di::singleton),

            di::bind<ports::input::IJournalRegistryService>()
                .to<application::JournalRegistryService>()
                .in(di::singleton),

            di::bind<ports::input::IPeriodService>()
                .to<application::PeriodService>()
                .in(di::singleton),

            di::bind<ports::input::IBalanceService>()
                .to<application::BalanceService>()
                .in(di::singleton),

            di::bind<ports::input::IJournalService>()
                .to<application::JournalService>()
                .in(di::singleton),

            di::bind<ports::input::IClosingService>()
                .to<application::ClosingService>()
                .in(di::singleton));
    }
}

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

void LedgerApp::loadEnvironment(int argc, char *argv[])
{
    std::cout << "[LedgerApp] Loading environment..." << std::endl;

    BoostBeastApplication::loadEnvironment(argc, argv);

    std::cout << "[LedgerApp] Environment loaded successfully" << std::endl;
}

void LedgerApp::configureInjection()
{
    printStartupBanner();

    auto ledgerSettings = std::make_shared<settings::LedgerSettings>(
        settings::LedgerSettings::fromEnvironment());

    std::cout << "[LedgerApp] Configuring Boost.DI injection (storage="
              << ledgerSettings->storage << ", currency=" << ledgerSettings->currency << ")" << std::endl;

    if (ledgerSettings->storage == "memory")
    {
        // Проводки и сальдо должны коммититься вместе: оба порта на одном объекте
        auto store = std::make_shared<adapters::secondary::InMemoryLedgerStore>();

        auto injector = di::make_injector(
            applicationModule(ledgerSettings),

            di::bind<ports::output::IAccountRepository>()
                .to<adapters::secondary::InMemoryAccountRepository>()
                .in(di::singleton),

            di::bind<ports::output::IJournalRepository>()
                .to<adapters::secondary::InMemoryJournalRepository>()
                .in(di::singleton),

            di::bind<ports::output::IPeriodRepository>()
                .to<adapters::secondary::InMemoryPeriodRepository>()
                .in(di::singleton),

            di::bind<ports::output::IJournalEntryRepository>().to(store),
            di::bind<ports::output::IBalanceRepository>().to(store));

        std::cout << "  ✓ Secondary Adapters: InMemory (5 bindings)" << std::endl;
        registerHandlers(injector);
    }
    else
    {
        auto dbSettings = std::make_shared<settings::DbSettings>();
        auto store = std::make_shared<adapters::secondary::PostgresLedgerStore>(dbSettings);

        auto injector = di::make_injector(
            applicationModule(ledgerSettings),

            di::bind<settings::DbSettings>().to(dbSettings),

            di::bind<ports::output::IAccountRepository>()
                .to<adapters::secondary::PostgresAccountRepository>()
                .in(di::singleton),

            di::bind<ports::output::IJournalRepository>()
                .to<adapters::secondary::PostgresJournalRepository>()
                .in(di::singleton),

            di::bind<ports::output::IPeriodRepository>()
                .to<adapters::secondary::PostgresPeriodRepository>()
                .in(di::singleton),

            di::bind<ports::output::IJournalEntryRepository>().to(store),
            di::bind<ports::output::IBalanceRepository>().to(store));

        std::cout << "  ✓ Secondary Adapters: PostgreSQL (5 bindings)" << std::endl;
        registerHandlers(injector);
    }

    std::cout << "\n[LedgerApp] DI configuration completed - "
              << handlers_.size() << " routes registered" << std::endl;
}

template <typename Injector>
void LedgerApp::registerHandlers(Injector& injector)
{
    metrics_ = injector.template create<std::shared_ptr<ports::input::IMetricsService>>();

    auto ledgerSettings = injector.template create<std::shared_ptr<settings::LedgerSettings>>();
    if (ledgerSettings->seedChart)
    {
        auto chart = injector.template create<std::shared_ptr<ports::input::IChartOfAccountsService>>();
        int created = chart->seedDefaultChart();
        std::cout << "[LedgerApp] Default chart seeded: " << created << " accounts created" << std::endl;
    }

    // Без журнала по умолчанию не проходят ни проводки без journal_code, ни закрытие года
    auto journals = injector.template create<std::shared_ptr<ports::input::IJournalRegistryService>>();
    int seededJournals = journals->seedDefaultJournals();
    std::cout << "[LedgerApp] Default journals seeded: " << seededJournals << " journals created" << std::endl;

    std::cout << "\n🎮 Registering HTTP Handlers via DI..." << std::endl;

    // ========================================================================
    // CHART OF ACCOUNTS
    // ========================================================================
    {
        auto handler = injector.template create<std::shared_ptr<adapters::primary::AccountHandler>>();
        route("POST", "/api/v1/accounts", handler);
        route("GET", "/api/v1/accounts", handler);
        route("GET", "/api/v1/accounts/*", handler);
        route("PATCH", "/api/v1/accounts/*", handler);
        std::cout << "  ✓ AccountHandler: POST/GET/PATCH /api/v1/accounts" << std::endl;
    }

    // ========================================================================
    // JOURNALS
    // ========================================================================
    {
        auto handler = injector.template create<std::shared_ptr<adapters::primary::JournalHandler>>();
        route("POST", "/api/v1/journals", handler);
        route("GET", "/api/v1/journals", handler);
        route("GET", "/api/v1/journals/*", handler);
        route("PATCH", "/api/v1/journals/*", handler);
        std::cout << "  ✓ JournalHandler: POST/GET/PATCH /api/v1/journals" << std::endl;
    }

    // ========================================================================
    // FISCAL YEARS & PERIODS
    // ========================================================================
    {
        auto handler = injector.template create<std::shared_ptr<adapters::primary::FiscalYearHandler>>();
        route("POST", "/api/v1/fiscal-years", handler);
        route("GET", "/api/v1/fiscal-years", handler);
        route("GET", "/api/v1/fiscal-years/*", handler);
        route("POST", "/api/v1/fiscal-years/close", handler);
        route("POST", "/api/v1/periods/close", handler);
        route("POST", "/api/v1/periods/lock", handler);
        route("POST", "/api/v1/periods/unlock", handler);
        std::cout << "  ✓ FiscalYearHandler: /api/v1/fiscal-years, /api/v1/periods" << std::endl;
    }

    // ========================================================================
    // JOURNAL ENTRIES
    // ========================================================================
    {
        auto handler = injector.template create<std::shared_ptr<adapters::primary::JournalEntryHandler>>();
        route("POST", "/api/v1/journal-entries", handler);
        route("GET", "/api/v1/journal-entries", handler);
        route("GET", "/api/v1/journal-entries/*", handler);
        route("POST", "/api/v1/journal-entries/lines", handler);
        route("DELETE", "/api/v1/journal-entries/lines", handler);
        route("POST", "/api/v1/journal-entries/validate", handler);
        route("POST", "/api/v1/journal-entries/post", handler);
        route("POST", "/api/v1/journal-entries/reverse", handler);
        route("POST", "/api/v1/journal-entries/archive", handler);
        std::cout << "  ✓ JournalEntryHandler: /api/v1/journal-entries" << std::endl;
    }

    // ========================================================================
    // BALANCES & REPORTS
    // ========================================================================
    {
        auto handler = injector.template create<std::shared_ptr<adapters::primary::BalanceHandler>>();
        route("GET", "/api/v1/balances/*", handler);
        route("GET", "/api/v1/trial-balance", handler);
        route("GET", "/api/v1/balance-drift", handler);
        std::cout << "  ✓ BalanceHandler: /api/v1/balances, /api/v1/trial-balance" << std::endl;
    }

    // ========================================================================
    // INFRASTRUCTURE HANDLERS
    // ========================================================================
    route("GET", "/health", std::make_shared<adapters::primary::HealthHandler>());
    route("GET", "/metrics", injector.template create<std::shared_ptr<adapters::primary::MetricsHandler>>());
    std::cout << "  ✓ HealthHandler: GET /health" << std::endl;
    std::cout << "  ✓ MetricsHandler: GET /metrics" << std::endl;
}

void LedgerApp::route(const std::string& method, const std::string& path,
                      const std::shared_ptr<IHttpHandler>& handler)
{
    handlers_[getHandlerKey(method, path)] =
        std::make_shared<adapters::primary::MetricsDecoratorHandler>(handler, metrics_);
}

void LedgerApp::printStartupBanner()
{
    std::cout << std::endl;
    std::cout << "╔══════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║          Ledger Service - General Ledger             ║" << std::endl;
    std::cout << "║                                                      ║" << std::endl;
    std::cout << "║  Architecture: Hexagonal (Ports & Adapters)          ║" << std::endl;
    std::cout << "║  DI Framework: Boost.DI                              ║" << std::endl;
    std::cout << "║  HTTP Server:  Boost.Beast                           ║" << std::endl;
    std::cout << "║  Storage:      PostgreSQL (libpqxx) / in-memory      ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════════════════╝" << std::endl;
    std::cout << std::endl;
}
