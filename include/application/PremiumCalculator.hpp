#pragma once

#include "domain/CalculationException.hpp"
#include "domain/Decimal.hpp"
#include "domain/PremiumTier.hpp"
#include "domain/Rate.hpp"
#include <algorithm>
#include <iostream>
#include <optional>
#include <vector>

namespace settlement::application {

/**
 * @brief Результат расчёта buyer's premium
 */
struct PremiumCalculation {
    domain::Decimal amount;                         ///< Округлено до 2 знаков
    domain::Decimal rate;                           ///< Фактически применённая ставка
    std::optional<domain::PremiumTier> appliedTier; ///< Пусто для плоской ставки и fallback
    bool fallback = false;
};

/**
 * @brief Расчёт buyer's premium: плоская ставка или ступенчатая шкала
 *
 * Непустой список ступеней имеет приоритет над плоской ставкой, но
 * переданная плоская ставка вне [0, 1] всё равно даёт INVALID_RATE.
 * Ступени сортируются по min_amount (stable), выбирается первая,
 * чей диапазон [min, max) содержит subtotal.
 *
 * Если ни одна ступень не подошла (дыра в шкале), применяется ставка
 * по умолчанию 0.10, appliedTier остаётся пустым, fallback = true.
 */
class PremiumCalculator {
public:
    static domain::Decimal defaultRate() { return domain::Decimal(10, 2); }

    explicit PremiumCalculator(domain::DecimalContext context)
        : context_(context) {}

    /**
     * @throws domain::CalculationException INVALID_RATE
     */
    PremiumCalculation calculate(
        const domain::Decimal& subtotal,
        const std::optional<domain::Decimal>& rate,
        const std::vector<domain::PremiumTier>& tiers) const
    {
        // Плоская ставка проверяется, даже если её перекрывает шкала
        domain::Decimal premiumRate = rate ? *rate : defaultRate();
        if (!domain::isRateInBounds(premiumRate)) {
            throw domain::CalculationException(
                domain::CalculationErrorKind::INVALID_RATE,
                "Invalid buyer's premium rate: " + premiumRate.toString()
                    + ". Rate must be between 0 and 1.");
        }

        if (!tiers.empty()) {
            return calculateTiered(subtotal, tiers);
        }

        PremiumCalculation result;
        result.rate = premiumRate;
        result.amount = amountFor(subtotal, premiumRate);
        return result;
    }

private:
    domain::DecimalContext context_;

    PremiumCalculation calculateTiered(
        const domain::Decimal& subtotal,
        const std::vector<domain::PremiumTier>& tiers) const
    {
        for (const auto& tier : tiers) {
            if (!domain::isRateInBounds(tier.rate)) {
                throw domain::CalculationException(
                    domain::CalculationErrorKind::INVALID_RATE,
                    "Invalid premium tier rate: " + tier.rate.toString()
                        + " (tier: " + tier.id + "). Rate must be between 0 and 1.");
            }
        }

        std::vector<domain::PremiumTier> sorted(tiers);
        std::stable_sort(sorted.begin(), sorted.end(),
            [](const domain::PremiumTier& a, const domain::PremiumTier& b) {
                return a.minAmount < b.minAmount;
            });

        auto it = std::find_if(sorted.begin(), sorted.end(),
            [&subtotal](const domain::PremiumTier& tier) { return tier.contains(subtotal); });

        PremiumCalculation result;
        if (it != sorted.end()) {
            result.rate = it->rate;
            result.appliedTier = *it;
        } else {
            std::clog << "[PremiumCalculator] WARN: no tier covers subtotal " << subtotal
                      << ", applying default rate " << defaultRate() << std::endl;
            result.rate = defaultRate();
            result.fallback = true;
        }
        result.amount = amountFor(subtotal, result.rate);
        return result;
    }

    domain::Decimal amountFor(const domain::Decimal& subtotal, const domain::Decimal& rate) const {
        return context_.quantize(context_.multiply(subtotal, rate), 2);
    }
};

} // namespace settlement::application
