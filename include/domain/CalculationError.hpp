#pragma once

#include "enums/CalculationErrorKind.hpp"
#include <string>

namespace settlement::domain {

class CalculationError {
public:
    CalculationErrorKind kind = CalculationErrorKind::EMPTY_INPUT;
    std::string message;

    CalculationError() = default;

    CalculationError(CalculationErrorKind k, const std::string& msg)
        : kind(k), message(msg) {}
};

} // namespace settlement::domain
