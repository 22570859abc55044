#pragma once

#include "DomainEvent.hpp"
#include "domain/CalculationError.hpp"
#include "domain/CalculationResult.hpp"
#include "domain/Decimal.hpp"
#include "domain/enums/CalculationStatus.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace settlement::domain {

/**
 * @brief Событие аудита: выполнен расчёт итогов
 *
 * Публикуется ровно один раз на каждый вызов compute(),
 * как при успехе, так и при ошибке.
 */
struct CalculationPerformedEvent : public DomainEvent {
    static constexpr const char* TYPE = "calculation_performed";

    std::string correlationId;
    double durationMs = 0.0;

    // Сводка входных данных
    size_t itemCount = 0;
    std::optional<Decimal> buyersPremiumRate;
    std::optional<Decimal> taxRate;
    bool tiersUsed = false;
    size_t tierCount = 0;

    CalculationStatus status = CalculationStatus::FAILED;
    std::optional<CalculationResult> result;
    std::optional<CalculationError> error;

    CalculationPerformedEvent() : DomainEvent(TYPE) {}

    std::string toJson() const override;
};

} // namespace settlement::domain
