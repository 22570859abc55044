#pragma once

#include "domain/Decimal.hpp"
#include <string>

namespace settlement::application {

/**
 * @brief Форматирование суммы для отображения: $1,234.56
 *
 * USD, EUR, GBP получают символ, остальные коды — префикс "CODE ".
 */
class CurrencyFormatter {
public:
    static std::string format(const domain::Decimal& amount, const std::string& currency = "USD") {
        const domain::Decimal rounded = amount.roundTo(2, domain::RoundingMode::HALF_EVEN);
        const std::string plain = rounded.abs().toString();

        const size_t point = plain.find('.');
        const std::string integerPart = plain.substr(0, point);
        const std::string fraction = plain.substr(point);

        std::string grouped;
        for (size_t i = 0; i < integerPart.size(); ++i) {
            if (i > 0 && (integerPart.size() - i) % 3 == 0) {
                grouped += ',';
            }
            grouped += integerPart[i];
        }

        std::string text = symbolFor(currency) + grouped + fraction;
        return rounded.isNegative() ? "-" + text : text;
    }

private:
    static std::string symbolFor(const std::string& currency) {
        if (currency == "USD") return "$";
        if (currency == "EUR") return "€";
        if (currency == "GBP") return "£";
        return currency + " ";
    }
};

} // namespace settlement::application
