#pragma once

#include "Decimal.hpp"
#include "PremiumTier.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace settlement::domain {

struct ItemBreakdown {
    std::string lotId;
    std::string title;
    int64_t quantity = 0;
    Decimal unitPrice;
    Decimal totalPrice;     ///< quantity * unitPrice, 2 знака

    bool operator==(const ItemBreakdown& other) const {
        return lotId == other.lotId && title == other.title && quantity == other.quantity
            && unitPrice == other.unitPrice && totalPrice == other.totalPrice;
    }
};

struct PremiumBreakdown {
    Decimal rate;
    Decimal amount;
    std::optional<PremiumTier> appliedTier;
    bool fallback = false;  ///< Ступени заданы, но ни одна не подошла

    bool operator==(const PremiumBreakdown& other) const {
        return rate == other.rate && amount == other.amount
            && appliedTier == other.appliedTier && fallback == other.fallback;
    }
};

struct TaxBreakdown {
    Decimal rate;
    Decimal taxableAmount;  ///< subtotal + premium без округления
    Decimal amount;

    bool operator==(const TaxBreakdown& other) const {
        return rate == other.rate && taxableAmount == other.taxableAmount && amount == other.amount;
    }
};

struct CalculationBreakdown {
    std::vector<ItemBreakdown> items;
    PremiumBreakdown buyersPremium;
    TaxBreakdown tax;

    bool operator==(const CalculationBreakdown& other) const {
        return items == other.items && buyersPremium == other.buyersPremium && tax == other.tax;
    }
};

/**
 * @brief Итоги расчёта счёта
 *
 * Все четыре суммы округлены до 2 знаков и сходятся до цента.
 */
class CalculationResult {
public:
    Decimal subtotal;
    Decimal buyersPremiumAmount;
    Decimal taxAmount;
    Decimal grandTotal;
    std::string currency = "USD";
    CalculationBreakdown breakdown;
    std::string checksum;

    CalculationResult() = default;

    bool operator==(const CalculationResult& other) const {
        return subtotal == other.subtotal
            && buyersPremiumAmount == other.buyersPremiumAmount
            && taxAmount == other.taxAmount
            && grandTotal == other.grandTotal
            && currency == other.currency
            && breakdown == other.breakdown
            && checksum == other.checksum;
    }
};

} // namespace settlement::domain
