#include "domain/events/CalculationPerformedEvent.hpp"
#include <nlohmann/json.hpp>

namespace settlement::domain {

namespace {

nlohmann::json optionalRate(const std::optional<Decimal>& rate) {
    if (!rate) {
        return nullptr;
    }
    return rate->normalized().toString();
}

} // namespace

std::string CalculationPerformedEvent::toJson() const {
    nlohmann::json j;
    j["event_id"] = eventId;
    j["event_type"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["correlation_id"] = correlationId;
    j["duration_ms"] = durationMs;
    j["inputs"] = {
        {"item_count", itemCount},
        {"buyers_premium_rate", optionalRate(buyersPremiumRate)},
        {"tax_rate", optionalRate(taxRate)},
        {"tiers_used", tiersUsed},
        {"tier_count", tierCount}
    };
    j["status"] = toString(status);

    if (result) {
        j["results"] = {
            {"subtotal", result->subtotal.toFixed(2)},
            {"buyers_premium_amount", result->buyersPremiumAmount.toFixed(2)},
            {"tax_amount", result->taxAmount.toFixed(2)},
            {"grand_total", result->grandTotal.toFixed(2)},
            {"currency", result->currency},
            {"checksum", result->checksum}
        };
    }
    if (error) {
        j["error"] = {
            {"kind", toString(error->kind)},
            {"message", error->message}
        };
    }
    return j.dump();
}

} // namespace settlement::domain
