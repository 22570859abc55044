#pragma once

#include "IEngineSettings.hpp"
#include "domain/Decimal.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace settlement::settings {

/**
 * @brief Настройки движка из окружения
 *
 * Читает из ENV:
 * - SETTLEMENT_CURRENCY (default: USD)
 * - SETTLEMENT_DECIMAL_PRECISION (default: 28, минимум 28)
 * - SETTLEMENT_AUDIT_SINK (default: console; none)
 *
 * Режим округления не настраивается: денежные суммы и checksum
 * всегда округляются HALF_EVEN.
 *
 * @throws std::invalid_argument при недопустимых значениях
 */
class EngineSettings : public IEngineSettings {
public:
    EngineSettings() {
        if (const char* val = std::getenv("SETTLEMENT_CURRENCY")) {
            currency_ = parseCurrency(val);
        }
        if (const char* val = std::getenv("SETTLEMENT_DECIMAL_PRECISION")) {
            int precision = std::stoi(val);
            if (precision < static_cast<int>(domain::DecimalContext::DEFAULT_PRECISION)) {
                throw std::invalid_argument(
                    "SETTLEMENT_DECIMAL_PRECISION must be at least "
                    + std::to_string(domain::DecimalContext::DEFAULT_PRECISION));
            }
            precision_ = static_cast<uint32_t>(precision);
        }
        if (const char* val = std::getenv("SETTLEMENT_AUDIT_SINK")) {
            std::string sink = val;
            if (sink != "console" && sink != "none") {
                throw std::invalid_argument("SETTLEMENT_AUDIT_SINK must be 'console' or 'none'");
            }
            auditSink_ = sink;
        }
    }

    std::string getCurrency() const override { return currency_; }
    uint32_t getDecimalPrecision() const override { return precision_; }
    std::string getAuditSink() const override { return auditSink_; }

private:
    std::string currency_ = "USD";
    uint32_t precision_ = domain::DecimalContext::DEFAULT_PRECISION;
    std::string auditSink_ = "console";

    static std::string parseCurrency(std::string code) {
        if (code.size() != 3 || !std::all_of(code.begin(), code.end(),
                [](unsigned char c) { return std::isalpha(c) != 0; })) {
            throw std::invalid_argument("SETTLEMENT_CURRENCY must be a 3-letter code: " + code);
        }
        std::transform(code.begin(), code.end(), code.begin(),
            [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return code;
    }
};

} // namespace settlement::settings
