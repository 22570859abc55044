#pragma once

#include "Decimal.hpp"
#include <optional>
#include <string>

namespace settlement::domain {

/**
 * @brief Ступень тарифа buyer's premium
 *
 * Диапазон [minAmount, maxAmount), отсутствие maxAmount — без верхней границы.
 */
class PremiumTier {
public:
    std::string id;
    std::string name;
    Decimal minAmount;
    std::optional<Decimal> maxAmount;
    Decimal rate;

    PremiumTier() = default;

    PremiumTier(const std::string& id_, const std::string& name_,
                const Decimal& min, std::optional<Decimal> max, const Decimal& r)
        : id(id_), name(name_), minAmount(min), maxAmount(std::move(max)), rate(r) {}

    bool contains(const Decimal& amount) const {
        if (amount < minAmount) {
            return false;
        }
        return !maxAmount || amount < *maxAmount;
    }

    bool operator==(const PremiumTier& other) const {
        return id == other.id && name == other.name && minAmount == other.minAmount
            && maxAmount == other.maxAmount && rate == other.rate;
    }
};

} // namespace settlement::domain
