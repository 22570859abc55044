#include "SettlementApp.hpp"
#include "application/CalculationService.hpp"
#include "adapters/secondary/ConsoleAuditSink.hpp"
#include "adapters/secondary/NullAuditSink.hpp"
#include "settings/EngineSettings.hpp"
#include <boost/di.hpp>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace di = boost::di;

namespace settlement
{

    SettlementApp::SettlementApp()
    {
        std::clog << "[SettlementApp] Initializing..." << std::endl;
    }

    SettlementApp::~SettlementApp()
    {
        std::clog << "[SettlementApp] Shutting down..." << std::endl;
    }

    int SettlementApp::run(int argc, char *argv[])
    {
        loadEnvironment(argc, argv);
        configureInjection();
        return start();
    }

    void SettlementApp::loadEnvironment(int argc, char *argv[])
    {
        if (argc < 2 || argc > 3)
        {
            throw std::invalid_argument("Usage: settlement-engine <compute|verify|validate> [file|-]");
        }
        command_ = argv[1];
        if (argc == 3)
        {
            inputPath_ = argv[2];
        }
        std::clog << "[SettlementApp] Command: " << command_ << ", input: " << inputPath_ << std::endl;
    }

    void SettlementApp::configureInjection()
    {
        std::clog << "[SettlementApp] Configuring DI..." << std::endl;

        // Шаг 1: настройки из ENV (один экземпляр на всё приложение)
        auto settingsInjector = di::make_injector(
            di::bind<settings::IEngineSettings>().to<settings::EngineSettings>().in(di::singleton));
        auto engineSettings = settingsInjector.create<std::shared_ptr<settings::IEngineSettings>>();

        // Шаг 2: приёмник аудита выбирается настройкой и биндится как instance
        if (engineSettings->getAuditSink() == "none")
        {
            auditSink_ = std::make_shared<adapters::secondary::NullAuditSink>();
        }
        else
        {
            auditSink_ = std::make_shared<adapters::secondary::ConsoleAuditSink>(std::clog);
        }

        // Шаг 3: основной injector
        auto injector = di::make_injector(
            di::bind<settings::IEngineSettings>().to(engineSettings),
            di::bind<ports::output::IAuditSink>().to(auditSink_),
            di::bind<ports::input::ICalculationService>().to<application::CalculationService>().in(di::singleton));

        handler_ = injector.create<std::shared_ptr<adapters::primary::CalculationCommandHandler>>();

        std::clog << "[SettlementApp] Ready" << std::endl;
    }

    int SettlementApp::start()
    {
        if (inputPath_ == "-")
        {
            return handler_->handle(command_, std::cin, std::cout);
        }

        std::ifstream file(inputPath_);
        if (!file)
        {
            throw std::runtime_error("Cannot open input file: " + inputPath_);
        }
        return handler_->handle(command_, file, std::cout);
    }

} // namespace settlement
