#pragma once

#include "domain/CalculationInputs.hpp"
#include "domain/Rate.hpp"
#include "domain/ValidationReport.hpp"
#include <string>

namespace settlement::application {

/**
 * @brief Проверка входных данных со сбором всех ошибок
 *
 * В отличие от compute(), не останавливается на первой проблеме.
 * Используется до расчёта, чтобы вернуть клиенту полный список.
 */
class InputValidator {
public:
    domain::ValidationReport validate(const domain::CalculationInputs& inputs) const {
        domain::ValidationReport report;

        if (inputs.items.empty()) {
            report.add("At least one item is required");
        }

        for (size_t i = 0; i < inputs.items.size(); ++i) {
            const auto& item = inputs.items[i];
            const std::string prefix = "Item " + std::to_string(i + 1) + ": ";

            if (item.lotId.empty()) {
                report.add(prefix + "lot_id is required");
            }
            if (item.title.empty()) {
                report.add(prefix + "title is required");
            }
            if (item.quantity <= 0) {
                report.add(prefix + "quantity must be greater than 0");
            }
            if (item.unitPrice.isNegative()) {
                report.add(prefix + "unit_price must not be negative");
            }
        }

        if (inputs.buyersPremiumRate && !domain::isRateInBounds(*inputs.buyersPremiumRate)) {
            report.add("Buyer's premium rate must be between 0 and 1");
        }
        if (inputs.taxRate && !domain::isRateInBounds(*inputs.taxRate)) {
            report.add("Tax rate must be between 0 and 1");
        }
        for (const auto& tier : inputs.premiumTiers) {
            if (!domain::isRateInBounds(tier.rate)) {
                report.add("Tier " + tier.id + ": rate must be between 0 and 1");
            }
        }

        return report;
    }
};

} // namespace settlement::application
