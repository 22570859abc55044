#include "domain/Decimal.hpp"
#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>

namespace settlement::domain {

namespace {

using Coefficient = Decimal::Coefficient;

Coefficient pow10(uint32_t exponent) {
    Coefficient result = boost::multiprecision::pow(Coefficient(10), exponent);
    return result;
}

// Деление модуля на 10^drop с округлением по mode
Coefficient divideRounded(const Coefficient& magnitude, uint32_t drop, RoundingMode mode) {
    Coefficient divisor = pow10(drop);
    Coefficient quotient = magnitude / divisor;
    Coefficient remainder = magnitude % divisor;

    if (remainder.is_zero() || mode == RoundingMode::DOWN) {
        return quotient;
    }

    Coefficient twice = remainder * 2;
    bool roundUp = false;
    if (mode == RoundingMode::HALF_UP) {
        roundUp = twice >= divisor;
    } else {
        roundUp = twice > divisor || (twice == divisor && boost::multiprecision::bit_test(quotient, 0));
    }
    if (roundUp) {
        quotient += 1;
    }
    return quotient;
}

} // namespace

Decimal Decimal::parse(const std::string& text) {
    size_t pos = 0;
    const size_t len = text.size();
    bool negative = false;

    if (pos < len && (text[pos] == '+' || text[pos] == '-')) {
        negative = text[pos] == '-';
        ++pos;
    }

    Coefficient coefficient = 0;
    uint32_t scale = 0;
    size_t digitCount = 0;

    while (pos < len && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        coefficient = coefficient * 10 + (text[pos] - '0');
        ++digitCount;
        ++pos;
    }

    if (pos < len && text[pos] == '.') {
        ++pos;
        while (pos < len && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            coefficient = coefficient * 10 + (text[pos] - '0');
            ++scale;
            ++digitCount;
            ++pos;
        }
    }

    if (digitCount == 0) {
        throw std::invalid_argument("Invalid decimal: '" + text + "'");
    }

    int64_t exponent = 0;
    if (pos < len && (text[pos] == 'e' || text[pos] == 'E')) {
        ++pos;
        bool negativeExponent = false;
        if (pos < len && (text[pos] == '+' || text[pos] == '-')) {
            negativeExponent = text[pos] == '-';
            ++pos;
        }
        size_t exponentDigits = 0;
        while (pos < len && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            exponent = exponent * 10 + (text[pos] - '0');
            if (exponent > std::numeric_limits<int32_t>::max()) {
                throw std::invalid_argument("Decimal exponent out of range: '" + text + "'");
            }
            ++exponentDigits;
            ++pos;
        }
        if (exponentDigits == 0) {
            throw std::invalid_argument("Invalid decimal: '" + text + "'");
        }
        if (negativeExponent) {
            exponent = -exponent;
        }
    }

    if (pos != len) {
        throw std::invalid_argument("Invalid decimal: '" + text + "'");
    }

    // Проверка до pow10: огромный scale или сдвиг вешает арифметику cpp_int
    int64_t effectiveScale = static_cast<int64_t>(scale) - exponent;
    if (effectiveScale > MAX_EXPONENT || effectiveScale < -MAX_EXPONENT) {
        throw std::invalid_argument("Decimal exponent out of range: '" + text + "'");
    }
    if (effectiveScale < 0) {
        coefficient *= pow10(static_cast<uint32_t>(-effectiveScale));
        effectiveScale = 0;
    }

    if (negative) {
        coefficient = -coefficient;
    }
    return Decimal(std::move(coefficient), static_cast<uint32_t>(effectiveScale));
}

uint32_t Decimal::digits() const {
    if (coefficient_.is_zero()) {
        return 1;
    }
    Coefficient magnitude = boost::multiprecision::abs(coefficient_);
    return static_cast<uint32_t>(magnitude.str().size());
}

Decimal Decimal::abs() const {
    Coefficient magnitude = boost::multiprecision::abs(coefficient_);
    return Decimal(std::move(magnitude), scale_);
}

Decimal Decimal::operator-() const {
    Coefficient negated = -coefficient_;
    return Decimal(std::move(negated), scale_);
}

Decimal Decimal::rescaled(uint32_t scale) const {
    if (scale <= scale_) {
        return *this;
    }
    Coefficient widened = coefficient_ * pow10(scale - scale_);
    return Decimal(std::move(widened), scale);
}

Decimal Decimal::operator+(const Decimal& other) const {
    const uint32_t scale = std::max(scale_, other.scale_);
    Coefficient sum = rescaled(scale).coefficient_ + other.rescaled(scale).coefficient_;
    return Decimal(std::move(sum), scale);
}

Decimal Decimal::operator-(const Decimal& other) const {
    const uint32_t scale = std::max(scale_, other.scale_);
    Coefficient difference = rescaled(scale).coefficient_ - other.rescaled(scale).coefficient_;
    return Decimal(std::move(difference), scale);
}

Decimal Decimal::operator*(const Decimal& other) const {
    Coefficient product = coefficient_ * other.coefficient_;
    return Decimal(std::move(product), scale_ + other.scale_);
}

Decimal Decimal::roundTo(uint32_t places, RoundingMode mode) const {
    if (places >= scale_) {
        return rescaled(places);
    }

    const bool negative = isNegative();
    Coefficient magnitude = boost::multiprecision::abs(coefficient_);
    Coefficient rounded = divideRounded(magnitude, scale_ - places, mode);
    if (negative) {
        rounded = -rounded;
    }
    return Decimal(std::move(rounded), places);
}

Decimal Decimal::normalized() const {
    if (coefficient_.is_zero()) {
        return Decimal();
    }
    Coefficient coefficient = coefficient_;
    uint32_t scale = scale_;
    while (scale > 0 && coefficient % 10 == 0) {
        coefficient /= 10;
        --scale;
    }
    return Decimal(std::move(coefficient), scale);
}

int Decimal::compare(const Decimal& other) const {
    const uint32_t scale = std::max(scale_, other.scale_);
    const Coefficient lhs = rescaled(scale).coefficient_;
    const Coefficient rhs = other.rescaled(scale).coefficient_;
    if (lhs < rhs) return -1;
    if (lhs > rhs) return 1;
    return 0;
}

std::string Decimal::toString() const {
    Coefficient magnitude = boost::multiprecision::abs(coefficient_);
    std::string digits = magnitude.str();

    if (scale_ > 0) {
        if (digits.size() <= scale_) {
            digits.insert(0, scale_ - digits.size() + 1, '0');
        }
        digits.insert(digits.size() - scale_, 1, '.');
    }

    if (isNegative()) {
        digits.insert(0, 1, '-');
    }
    return digits;
}

std::string Decimal::toFixed(uint32_t places, RoundingMode mode) const {
    return roundTo(places, mode).toString();
}

DecimalContext::DecimalContext(uint32_t precision, RoundingMode rounding)
    : precision_(precision)
    , rounding_(rounding)
{
    if (precision_ == 0) {
        throw std::invalid_argument("Decimal precision must be at least 1 digit");
    }
}

Decimal DecimalContext::apply(const Decimal& value) const {
    const uint32_t digits = value.digits();
    if (digits <= precision_) {
        return value;
    }

    // Цифры целой части не отбрасываются
    const uint32_t excess = digits - precision_;
    const uint32_t places = excess >= value.scale() ? 0 : value.scale() - excess;
    return value.roundTo(places, rounding_);
}

} // namespace settlement::domain
