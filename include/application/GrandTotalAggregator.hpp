#pragma once

#include "domain/Decimal.hpp"

namespace settlement::application {

/**
 * @brief Итог = round2(subtotal) + premium + tax, результат округлён до 2 знаков
 *
 * Subtotal округляется один раз, здесь, а не раньше.
 */
class GrandTotalAggregator {
public:
    explicit GrandTotalAggregator(domain::DecimalContext context)
        : context_(context) {}

    domain::Decimal aggregate(
        const domain::Decimal& subtotal,
        const domain::Decimal& premiumAmount,
        const domain::Decimal& taxAmount) const
    {
        domain::Decimal roundedSubtotal = context_.quantize(subtotal, 2);
        domain::Decimal total = context_.add(context_.add(roundedSubtotal, premiumAmount), taxAmount);
        return context_.quantize(total, 2);
    }

private:
    domain::DecimalContext context_;
};

} // namespace settlement::application
