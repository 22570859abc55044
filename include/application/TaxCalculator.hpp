#pragma once

#include "domain/CalculationException.hpp"
#include "domain/Decimal.hpp"
#include "domain/Rate.hpp"
#include <optional>

namespace settlement::application {

struct TaxCalculation {
    domain::Decimal rate;
    domain::Decimal taxableAmount;  ///< subtotal + premium, без округления
    domain::Decimal amount;         ///< Округлено до 2 знаков
};

/**
 * @brief Налог на (subtotal + buyer's premium)
 */
class TaxCalculator {
public:
    static domain::Decimal defaultRate() { return domain::Decimal(85, 3); }

    explicit TaxCalculator(domain::DecimalContext context)
        : context_(context) {}

    /**
     * @throws domain::CalculationException INVALID_RATE
     */
    TaxCalculation calculate(
        const domain::Decimal& subtotal,
        const domain::Decimal& premiumAmount,
        const std::optional<domain::Decimal>& rate) const
    {
        domain::Decimal taxRate = rate ? *rate : defaultRate();
        if (!domain::isRateInBounds(taxRate)) {
            throw domain::CalculationException(
                domain::CalculationErrorKind::INVALID_RATE,
                "Invalid tax rate: " + taxRate.toString() + ". Rate must be between 0 and 1.");
        }

        TaxCalculation result;
        result.rate = taxRate;
        result.taxableAmount = context_.add(subtotal, premiumAmount);
        result.amount = context_.quantize(context_.multiply(result.taxableAmount, taxRate), 2);
        return result;
    }

private:
    domain::DecimalContext context_;
};

} // namespace settlement::application
