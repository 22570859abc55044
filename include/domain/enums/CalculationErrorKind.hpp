#pragma once

#include <string>

namespace settlement::domain {

enum class CalculationErrorKind {
    EMPTY_INPUT,
    INVALID_ITEM,
    ZERO_SUBTOTAL,
    INVALID_RATE,
    VERIFICATION_FAILED
};

inline std::string toString(CalculationErrorKind kind) {
    switch (kind) {
        case CalculationErrorKind::EMPTY_INPUT: return "EMPTY_INPUT";
        case CalculationErrorKind::INVALID_ITEM: return "INVALID_ITEM";
        case CalculationErrorKind::ZERO_SUBTOTAL: return "ZERO_SUBTOTAL";
        case CalculationErrorKind::INVALID_RATE: return "INVALID_RATE";
        case CalculationErrorKind::VERIFICATION_FAILED: return "VERIFICATION_FAILED";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Ошибка входных данных (4xx) или дефект движка (5xx)
 *
 * VERIFICATION_FAILED означает ошибку движка или конфигурации,
 * все остальные виды — некорректный ввод.
 */
inline bool isInputError(CalculationErrorKind kind) {
    return kind != CalculationErrorKind::VERIFICATION_FAILED;
}

} // namespace settlement::domain
