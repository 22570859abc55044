#pragma once

#include "Decimal.hpp"

namespace settlement::domain {

/// Ставка (премия, налог, ступень) должна лежать в [0, 1]
inline bool isRateInBounds(const Decimal& rate) {
    return rate >= Decimal(0) && rate <= Decimal(1);
}

} // namespace settlement::domain
