#include "adapters/primary/CalculationJsonMapper.hpp"
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace settlement::adapters::primary {

namespace {

std::optional<domain::Decimal> optionalDecimal(const nlohmann::json& body, const std::string& field) {
    if (!body.contains(field) || body[field].is_null()) {
        return std::nullopt;
    }
    return CalculationJsonMapper::parseDecimal(body[field], field);
}

domain::Decimal requiredDecimal(const nlohmann::json& body, const std::string& field) {
    if (!body.contains(field) || body[field].is_null()) {
        throw std::invalid_argument(field + " is required");
    }
    return CalculationJsonMapper::parseDecimal(body[field], field);
}

// id ступени в хранилище может быть числом
std::string idString(const nlohmann::json& body, const std::string& field) {
    if (!body.contains(field) || body[field].is_null()) {
        return "";
    }
    const auto& value = body[field];
    return value.is_string() ? value.get<std::string>() : value.dump();
}

// Количество только целое: 2.7 не усекается до 2, 1e30 не приводится к int64
int64_t quantity(const nlohmann::json& body) {
    if (!body.contains("quantity") || body["quantity"].is_null()) {
        return 0;
    }
    const auto& value = body["quantity"];
    if (value.is_number_unsigned()) {
        if (value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            throw std::invalid_argument("quantity must be a positive integer");
        }
        return static_cast<int64_t>(value.get<uint64_t>());
    }
    if (value.is_number_integer()) {
        return value.get<int64_t>();
    }
    throw std::invalid_argument("quantity must be a positive integer");
}

} // namespace

domain::Decimal CalculationJsonMapper::parseDecimal(const nlohmann::json& value, const std::string& field) {
    try {
        if (value.is_string()) {
            return domain::Decimal::parse(value.get<std::string>());
        }
        if (value.is_number()) {
            // dump() даёт кратчайшее точное представление: 99.99 -> "99.99"
            return domain::Decimal::parse(value.dump());
        }
    } catch (const std::invalid_argument& e) {
        throw std::invalid_argument(field + ": " + e.what());
    }
    throw std::invalid_argument(field + " must be a decimal number or string");
}

domain::CalculationInputs CalculationJsonMapper::parseInputs(const nlohmann::json& body) {
    if (!body.is_object()) {
        throw std::invalid_argument("Request body must be a JSON object");
    }

    domain::CalculationInputs inputs;

    if (body.contains("items") && !body["items"].is_null()) {
        const auto& items = body["items"];
        if (!items.is_array()) {
            throw std::invalid_argument("items must be an array");
        }
        for (const auto& item : items) {
            domain::LineItem line;
            line.lotId = idString(item, "lot_id");
            line.title = item.value("title", "");
            line.quantity = quantity(item);
            line.unitPrice = requiredDecimal(item, "unit_price");
            inputs.items.push_back(std::move(line));
        }
    }

    inputs.buyersPremiumRate = optionalDecimal(body, "buyers_premium_rate");
    inputs.taxRate = optionalDecimal(body, "tax_rate");

    if (body.contains("premium_tiers") && !body["premium_tiers"].is_null()) {
        const auto& tiers = body["premium_tiers"];
        if (!tiers.is_array()) {
            throw std::invalid_argument("premium_tiers must be an array");
        }
        for (const auto& tier : tiers) {
            inputs.premiumTiers.push_back(parseTier(tier));
        }
    }

    return inputs;
}

domain::PremiumTier CalculationJsonMapper::parseTier(const nlohmann::json& body) {
    domain::PremiumTier tier;
    tier.id = idString(body, "id");
    tier.name = body.value("name", body.value("description", ""));
    tier.minAmount = requiredDecimal(body, "min_amount");
    tier.maxAmount = optionalDecimal(body, "max_amount");
    tier.rate = requiredDecimal(body, "rate");
    return tier;
}

domain::CalculationResult CalculationJsonMapper::parseResult(const nlohmann::json& body) {
    if (!body.is_object()) {
        throw std::invalid_argument("Result must be a JSON object");
    }

    domain::CalculationResult result;
    result.subtotal = requiredDecimal(body, "subtotal");
    result.buyersPremiumAmount = requiredDecimal(body, "buyers_premium_amount");
    result.taxAmount = requiredDecimal(body, "tax_amount");
    result.grandTotal = requiredDecimal(body, "grand_total");
    result.currency = body.value("currency", "USD");
    result.checksum = body.value("checksum", "");

    if (!body.contains("breakdown") || !body["breakdown"].is_object()) {
        return result;
    }
    const auto& breakdown = body["breakdown"];

    if (breakdown.contains("items") && breakdown["items"].is_array()) {
        for (const auto& item : breakdown["items"]) {
            domain::ItemBreakdown line;
            line.lotId = idString(item, "lot_id");
            line.title = item.value("title", "");
            line.quantity = quantity(item);
            line.unitPrice = requiredDecimal(item, "unit_price");
            line.totalPrice = requiredDecimal(item, "total_price");
            result.breakdown.items.push_back(std::move(line));
        }
    }

    if (breakdown.contains("buyers_premium") && breakdown["buyers_premium"].is_object()) {
        const auto& premium = breakdown["buyers_premium"];
        result.breakdown.buyersPremium.rate = requiredDecimal(premium, "rate");
        result.breakdown.buyersPremium.amount = requiredDecimal(premium, "amount");
        result.breakdown.buyersPremium.fallback = premium.value("fallback", false);
        if (premium.contains("applied_tier") && premium["applied_tier"].is_object()) {
            result.breakdown.buyersPremium.appliedTier = parseTier(premium["applied_tier"]);
        }
    }

    if (breakdown.contains("tax") && breakdown["tax"].is_object()) {
        const auto& tax = breakdown["tax"];
        result.breakdown.tax.rate = requiredDecimal(tax, "rate");
        result.breakdown.tax.taxableAmount = requiredDecimal(tax, "taxable_amount");
        result.breakdown.tax.amount = requiredDecimal(tax, "amount");
    }

    return result;
}

nlohmann::json CalculationJsonMapper::toJson(const domain::CalculationResult& result) {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& item : result.breakdown.items) {
        items.push_back({
            {"lot_id", item.lotId},
            {"title", item.title},
            {"quantity", item.quantity},
            {"unit_price", money(item.unitPrice)},
            {"total_price", money(item.totalPrice)}
        });
    }

    const auto& premium = result.breakdown.buyersPremium;
    nlohmann::json premiumJson = {
        {"rate", plain(premium.rate)},
        {"amount", money(premium.amount)},
        {"applied_tier", premium.appliedTier ? tierToJson(*premium.appliedTier) : nlohmann::json(nullptr)},
        {"fallback", premium.fallback}
    };

    const auto& tax = result.breakdown.tax;
    nlohmann::json taxJson = {
        {"rate", plain(tax.rate)},
        {"taxable_amount", money(tax.taxableAmount)},
        {"amount", money(tax.amount)}
    };

    nlohmann::json j;
    j["subtotal"] = money(result.subtotal);
    j["buyers_premium_amount"] = money(result.buyersPremiumAmount);
    j["tax_amount"] = money(result.taxAmount);
    j["grand_total"] = money(result.grandTotal);
    j["currency"] = result.currency;
    j["checksum"] = result.checksum;
    j["breakdown"] = {
        {"items", items},
        {"buyers_premium", premiumJson},
        {"tax", taxJson}
    };
    return j;
}

nlohmann::json CalculationJsonMapper::toJson(const domain::VerificationOutcome& outcome) {
    nlohmann::json j;
    j["accurate"] = outcome.accurate;
    j["error"] = outcome.error ? nlohmann::json(*outcome.error) : nlohmann::json(nullptr);
    return j;
}

nlohmann::json CalculationJsonMapper::toJson(const domain::CalculationError& error) {
    nlohmann::json j;
    j["error"] = domain::toString(error.kind);
    j["message"] = error.message;
    return j;
}

nlohmann::json CalculationJsonMapper::toJson(const domain::ValidationReport& report) {
    nlohmann::json j;
    j["valid"] = report.valid();
    j["errors"] = report.errors;
    return j;
}

nlohmann::json CalculationJsonMapper::tierToJson(const domain::PremiumTier& tier) {
    return {
        {"id", tier.id},
        {"name", tier.name},
        {"min_amount", plain(tier.minAmount)},
        {"max_amount", tier.maxAmount ? nlohmann::json(plain(*tier.maxAmount)) : nlohmann::json(nullptr)},
        {"rate", plain(tier.rate)}
    };
}

std::string CalculationJsonMapper::money(const domain::Decimal& value) {
    return value.toFixed(2);
}

std::string CalculationJsonMapper::plain(const domain::Decimal& value) {
    return value.normalized().toString();
}

} // namespace settlement::adapters::primary
