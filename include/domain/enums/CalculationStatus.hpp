#pragma once

#include <string>

namespace settlement::domain {

enum class CalculationStatus {
    SUCCEEDED,
    FAILED
};

inline std::string toString(CalculationStatus status) {
    switch (status) {
        case CalculationStatus::SUCCEEDED: return "SUCCEEDED";
        case CalculationStatus::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

} // namespace settlement::domain
