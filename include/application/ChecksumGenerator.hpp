#pragma once

#include "domain/CalculationResult.hpp"
#include "domain/Decimal.hpp"
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

namespace settlement::application {

/**
 * @brief Детерминированный отпечаток итогов расчёта
 *
 * Строка "subtotal|premium|tax|grand_total|CURRENCY" (суммы ровно с двумя
 * знаками, HALF_EVEN) хэшируется 32-битным полиномиальным хэшем
 * h = h * 31 + byte и выводится как 8 hex-цифр.
 *
 * @note Не криптографическая защита: отпечаток для корреляции аудита.
 */
class ChecksumGenerator {
public:
    std::string generate(const domain::CalculationResult& result) const {
        return generate(result.subtotal, result.buyersPremiumAmount,
                        result.taxAmount, result.grandTotal, result.currency);
    }

    std::string generate(
        const domain::Decimal& subtotal,
        const domain::Decimal& premiumAmount,
        const domain::Decimal& taxAmount,
        const domain::Decimal& grandTotal,
        const std::string& currency) const
    {
        return toHex(hash(payload(subtotal, premiumAmount, taxAmount, grandTotal, currency)));
    }

    static std::string payload(
        const domain::Decimal& subtotal,
        const domain::Decimal& premiumAmount,
        const domain::Decimal& taxAmount,
        const domain::Decimal& grandTotal,
        const std::string& currency)
    {
        return subtotal.toFixed(2) + "|" + premiumAmount.toFixed(2) + "|"
            + taxAmount.toFixed(2) + "|" + grandTotal.toFixed(2) + "|" + currency;
    }

    static uint32_t hash(const std::string& data) {
        uint32_t h = 0;
        for (unsigned char c : data) {
            h = h * 31u + c;
        }
        return h;
    }

private:
    static std::string toHex(uint32_t value) {
        std::ostringstream ss;
        ss << std::hex << std::setfill('0') << std::setw(8) << value;
        return ss.str();
    }
};

} // namespace settlement::application
