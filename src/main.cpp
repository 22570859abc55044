#include "SettlementApp.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    try {
        std::clog << "========================================" << std::endl;
        std::clog << "  Settlement Engine v1.0.0" << std::endl;
        std::clog << "========================================" << std::endl;

        settlement::SettlementApp app;

        // Template Method вызывает:
        // 1. loadEnvironment()
        // 2. configureInjection()
        // 3. start()
        int exitCode = app.run(argc, argv);

        std::clog << "[main] Settlement Engine finished with code " << exitCode << std::endl;
        return exitCode;

    } catch (const std::exception& e) {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
