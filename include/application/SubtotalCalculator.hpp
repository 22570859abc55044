#pragma once

#include "domain/CalculationException.hpp"
#include "domain/Decimal.hpp"
#include "domain/LineItem.hpp"
#include <vector>

namespace settlement::application {

/**
 * @brief Сумма quantity * unit_price по всем позициям
 *
 * Результат не округляется: округление выполняется только на выходе.
 */
class SubtotalCalculator {
public:
    explicit SubtotalCalculator(domain::DecimalContext context)
        : context_(context) {}

    /**
     * @throws domain::CalculationException EMPTY_INPUT, INVALID_ITEM, ZERO_SUBTOTAL
     */
    domain::Decimal calculate(const std::vector<domain::LineItem>& items) const {
        if (items.empty()) {
            throw domain::CalculationException(
                domain::CalculationErrorKind::EMPTY_INPUT,
                "At least one item is required for calculation");
        }

        domain::Decimal subtotal;
        for (const auto& item : items) {
            if (item.quantity <= 0) {
                throw domain::CalculationException(
                    domain::CalculationErrorKind::INVALID_ITEM,
                    "Invalid item data: quantity must be greater than 0 (lot: " + item.lotId + ")");
            }
            if (item.unitPrice.isNegative()) {
                throw domain::CalculationException(
                    domain::CalculationErrorKind::INVALID_ITEM,
                    "Invalid item data: unit_price must not be negative (lot: " + item.lotId + ")");
            }
            subtotal = context_.add(subtotal, lineTotal(item));
        }

        if (subtotal.isZero()) {
            throw domain::CalculationException(
                domain::CalculationErrorKind::ZERO_SUBTOTAL,
                "Subtotal cannot be zero");
        }
        return subtotal;
    }

    domain::Decimal lineTotal(const domain::LineItem& item) const {
        return context_.multiply(domain::Decimal(item.quantity), item.unitPrice);
    }

private:
    domain::DecimalContext context_;
};

} // namespace settlement::application
