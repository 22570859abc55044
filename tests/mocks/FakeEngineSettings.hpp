#pragma once

#include "settings/IEngineSettings.hpp"
#include <cstdint>
#include <string>

namespace settlement::tests {

/**
 * @brief Фиксированные настройки движка для тестов (без ENV)
 */
class FakeEngineSettings : public settings::IEngineSettings {
public:
    std::string currency = "USD";
    uint32_t precision = 28;
    std::string auditSink = "none";

    std::string getCurrency() const override { return currency; }
    uint32_t getDecimalPrecision() const override { return precision; }
    std::string getAuditSink() const override { return auditSink; }
};

} // namespace settlement::tests
