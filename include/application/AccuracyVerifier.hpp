#pragma once

#include "domain/CalculationResult.hpp"
#include "domain/Decimal.hpp"
#include "domain/VerificationOutcome.hpp"
#include <string>
#include <utility>

namespace settlement::application {

/**
 * @brief Независимая проверка итогов расчёта
 *
 * Проверки выполняются по порядку до первой ошибки:
 * 1. subtotal, premium, tax и grand total неотрицательны;
 * 2. |subtotal + premium + tax - grand_total| <= 0.01.
 *
 * Чистая функция над четырьмя итоговыми суммами, контекст не нужен:
 * сложение Decimal точное.
 */
class AccuracyVerifier {
public:
    static domain::Decimal tolerance() { return domain::Decimal(1, 2); }

    domain::VerificationOutcome verify(const domain::CalculationResult& result) const {
        return verify(result.subtotal, result.buyersPremiumAmount, result.taxAmount, result.grandTotal);
    }

    domain::VerificationOutcome verify(
        const domain::Decimal& subtotal,
        const domain::Decimal& premiumAmount,
        const domain::Decimal& taxAmount,
        const domain::Decimal& grandTotal) const
    {
        const std::pair<const char*, const domain::Decimal*> components[] = {
            {"subtotal", &subtotal},
            {"buyers_premium_amount", &premiumAmount},
            {"tax_amount", &taxAmount},
            {"grand_total", &grandTotal}
        };
        for (const auto& [name, value] : components) {
            if (value->isNegative()) {
                return domain::VerificationOutcome::failed(
                    std::string("Negative component: ") + name + " = " + value->toString());
            }
        }

        domain::Decimal sum = subtotal + premiumAmount + taxAmount;
        domain::Decimal discrepancy = (sum - grandTotal).abs();
        if (discrepancy > tolerance()) {
            return domain::VerificationOutcome::failed(
                "Grand total mismatch: subtotal + premium + tax = " + sum.toString()
                    + ", grand_total = " + grandTotal.toString()
                    + ", discrepancy = " + discrepancy.toString());
        }

        return domain::VerificationOutcome::ok();
    }
};

} // namespace settlement::application
