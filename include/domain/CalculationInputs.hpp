#pragma once

#include "Decimal.hpp"
#include "LineItem.hpp"
#include "PremiumTier.hpp"
#include <optional>
#include <vector>

namespace settlement::domain {

/**
 * @brief Входные данные расчёта
 *
 * Ставки уже разрешены вызывающей стороной. Непустой список ступеней
 * имеет приоритет над плоской ставкой премии.
 */
class CalculationInputs {
public:
    std::vector<LineItem> items;
    std::optional<Decimal> buyersPremiumRate;
    std::optional<Decimal> taxRate;
    std::vector<PremiumTier> premiumTiers;

    CalculationInputs() = default;

    bool usesTiers() const { return !premiumTiers.empty(); }
};

} // namespace settlement::domain
