#pragma once

#include "domain/CalculationError.hpp"
#include "domain/CalculationInputs.hpp"
#include "domain/CalculationResult.hpp"
#include "domain/Decimal.hpp"
#include "domain/ValidationReport.hpp"
#include "domain/VerificationOutcome.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace settlement::adapters::primary {

/**
 * @brief JSON <-> доменные объекты расчёта
 *
 * Денежные поля выводятся строками ровно с 2 знаками ("119.35"),
 * ставки и границы ступеней — нормализованными строками ("0.085").
 * На входе десятичные значения принимаются строкой или числом.
 *
 * @throws std::invalid_argument при неверной структуре или значении поля
 * @throws nlohmann::json::exception при неверных типах
 */
class CalculationJsonMapper {
public:
    static domain::CalculationInputs parseInputs(const nlohmann::json& body);
    static domain::CalculationResult parseResult(const nlohmann::json& body);

    static nlohmann::json toJson(const domain::CalculationResult& result);
    static nlohmann::json toJson(const domain::VerificationOutcome& outcome);
    static nlohmann::json toJson(const domain::CalculationError& error);
    static nlohmann::json toJson(const domain::ValidationReport& report);

    static domain::Decimal parseDecimal(const nlohmann::json& value, const std::string& field);

private:
    static domain::PremiumTier parseTier(const nlohmann::json& body);
    static nlohmann::json tierToJson(const domain::PremiumTier& tier);
    static std::string money(const domain::Decimal& value);
    static std::string plain(const domain::Decimal& value);
};

} // namespace settlement::adapters::primary
