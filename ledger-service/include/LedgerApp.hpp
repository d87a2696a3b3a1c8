#pragma once

#include <BoostBeastApplication.hpp>
#include <IHttpHandler.hpp>
#include <boost/di.hpp>
#include <memory>
#include <string>

namespace ledger::ports::input {
    class IMetricsService;
}

/**
 * @class LedgerApp
 * @brief Сервис бухгалтерской книги (general ledger)
 *
 * Наследует BoostBeastApplication с Template Method паттерном:
 * 1. loadEnvironment() - загрузка config.json в Environment
 * 2. configureInjection() - настройка Boost.DI и регистрация handlers
 * 3. start() - запуск HTTP сервера (из базового класса)
 *
 * Хранилище выбирается LEDGER_STORAGE:
 * - postgres: Postgres* адаптеры (libpqxx)
 * - memory: InMemory* адаптеры, данные живут до остановки процесса
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
     * 1. Output Ports → Secondary Adapters выбранного хранилища
     * 2. Input Ports → Application Services
     * 3. Primary Adapters (Handlers), обёрнутые в MetricsDecoratorHandler
     */
    void configureInjection() override;

private:
    template <typename Injector>
    void registerHandlers(Injector& injector);

    void route(const std::string& method, const std::string& path,
               const std::shared_ptr<IHttpHandler>& handler);

    void printStartupBanner();

    std::shared_ptr<ledger::ports::input::IMetricsService> metrics_;
};
