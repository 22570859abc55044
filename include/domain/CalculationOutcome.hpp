#pragma once

#include "CalculationError.hpp"
#include "CalculationResult.hpp"
#include "enums/CalculationStatus.hpp"
#include <optional>

namespace settlement::domain {

/**
 * @brief Итог вызова compute: либо результат, либо ошибка
 *
 * Частично заполненный результат никогда не возвращается.
 */
class CalculationOutcome {
public:
    std::optional<CalculationResult> result;
    std::optional<CalculationError> error;

    static CalculationOutcome success(CalculationResult value) {
        CalculationOutcome outcome;
        outcome.result = std::move(value);
        return outcome;
    }

    static CalculationOutcome failure(CalculationError value) {
        CalculationOutcome outcome;
        outcome.error = std::move(value);
        return outcome;
    }

    bool succeeded() const { return result.has_value(); }

    CalculationStatus status() const {
        return succeeded() ? CalculationStatus::SUCCEEDED : CalculationStatus::FAILED;
    }
};

} // namespace settlement::domain
