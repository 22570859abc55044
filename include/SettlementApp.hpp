#pragma once

#include "adapters/primary/CalculationCommandHandler.hpp"
#include "ports/output/IAuditSink.hpp"
#include <memory>
#include <string>

namespace settlement
{

    /**
     * @brief CLI-приложение движка расчёта итогов
     *
     * Template Method: run() вызывает
     * 1. loadEnvironment()    — разбор аргументов
     * 2. configureInjection() — настройки, аудит, сервис, обработчик через Boost.DI
     * 3. start()              — выполнение команды
     *
     * Использование: settlement-engine <compute|verify|validate> [file|-]
     */
    class SettlementApp
    {
    public:
        SettlementApp();
        virtual ~SettlementApp();

        int run(int argc, char *argv[]);

    protected:
        virtual void loadEnvironment(int argc, char *argv[]);
        virtual void configureInjection();
        virtual int start();

    private:
        std::string command_;
        std::string inputPath_ = "-";
        std::shared_ptr<ports::output::IAuditSink> auditSink_;
        std::shared_ptr<adapters::primary::CalculationCommandHandler> handler_;
    };

} // namespace settlement
