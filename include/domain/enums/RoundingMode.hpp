#pragma once

#include <string>

namespace settlement::domain {

/**
 * @brief Режим округления десятичных значений
 */
enum class RoundingMode {
    HALF_EVEN,  ///< Банковское округление (по умолчанию)
    HALF_UP,
    DOWN        ///< Отбрасывание (к нулю)
};

inline std::string toString(RoundingMode mode) {
    switch (mode) {
        case RoundingMode::HALF_EVEN: return "HALF_EVEN";
        case RoundingMode::HALF_UP: return "HALF_UP";
        case RoundingMode::DOWN: return "DOWN";
        default: return "UNKNOWN";
    }
}

} // namespace settlement::domain
