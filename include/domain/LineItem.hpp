#pragma once

#include "Decimal.hpp"
#include <cstdint>
#include <string>

namespace settlement::domain {

/**
 * @brief Позиция счёта (проданный лот)
 */
class LineItem {
public:
    std::string lotId;
    std::string title;
    int64_t quantity = 0;
    Decimal unitPrice;

    LineItem() = default;

    LineItem(const std::string& lot, const std::string& t, int64_t qty, const Decimal& price)
        : lotId(lot), title(t), quantity(qty), unitPrice(price) {}
};

} // namespace settlement::domain
