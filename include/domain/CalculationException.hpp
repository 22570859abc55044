#pragma once

#include "CalculationError.hpp"
#include "enums/CalculationErrorKind.hpp"
#include <stdexcept>
#include <string>

namespace settlement::domain {

/**
 * @brief Исключение, выбрасываемое компонентами расчёта
 *
 * Перехватывается только на границе CalculationService и превращается
 * в CalculationOutcome::failure.
 */
class CalculationException : public std::runtime_error {
public:
    CalculationException(CalculationErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    CalculationErrorKind kind() const { return kind_; }

    CalculationError toError() const { return CalculationError(kind_, what()); }

private:
    CalculationErrorKind kind_;
};

} // namespace settlement::domain
