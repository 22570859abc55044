#pragma once

#include "enums/RoundingMode.hpp"
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <ostream>
#include <string>

namespace settlement::domain {

/**
 * @brief Знаковое десятичное число произвольной точности
 *
 * Значение = coefficient * 10^(-scale).
 * Сложение, вычитание и умножение точные, округление выполняется
 * только явно: через roundTo() или DecimalContext.
 *
 * @example
 * ```cpp
 * auto price = Decimal::parse("99.99");
 * auto total = price * Decimal(3);          // 299.97
 * auto fee = (total * Decimal::parse("0.085"))
 *                .roundTo(2, RoundingMode::HALF_EVEN);  // 25.50
 * ```
 */
class Decimal {
public:
    using Coefficient = boost::multiprecision::cpp_int;

    /// Предел |экспоненты| после разбора: 10^1000 на порядки шире любых денег
    static constexpr int64_t MAX_EXPONENT = 1000;

    Decimal() = default;

    Decimal(int64_t value) : coefficient_(value), scale_(0) {}

    Decimal(Coefficient coefficient, uint32_t scale)
        : coefficient_(std::move(coefficient)), scale_(scale) {}

    /**
     * @brief Разобрать строку вида [+-]digits[.digits][e[+-]digits]
     * @throws std::invalid_argument при неверном формате или если итоговый
     *         scale либо сдвиг влево выходит за MAX_EXPONENT
     */
    static Decimal parse(const std::string& text);

    const Coefficient& coefficient() const { return coefficient_; }
    uint32_t scale() const { return scale_; }

    bool isZero() const { return coefficient_.is_zero(); }
    bool isNegative() const { return coefficient_.sign() < 0; }

    /// Количество значащих цифр коэффициента
    uint32_t digits() const;

    Decimal abs() const;
    Decimal operator-() const;

    Decimal operator+(const Decimal& other) const;
    Decimal operator-(const Decimal& other) const;
    Decimal operator*(const Decimal& other) const;

    /**
     * @brief Округлить до заданного числа знаков после запятой
     *
     * Если places больше текущего scale, значение дополняется нулями.
     */
    Decimal roundTo(uint32_t places, RoundingMode mode) const;

    /// Убрать незначащие нули в дробной части
    Decimal normalized() const;

    int compare(const Decimal& other) const;

    bool operator==(const Decimal& other) const { return compare(other) == 0; }
    bool operator!=(const Decimal& other) const { return compare(other) != 0; }
    bool operator<(const Decimal& other) const { return compare(other) < 0; }
    bool operator<=(const Decimal& other) const { return compare(other) <= 0; }
    bool operator>(const Decimal& other) const { return compare(other) > 0; }
    bool operator>=(const Decimal& other) const { return compare(other) >= 0; }

    /// Представление с текущим scale (без экспоненты)
    std::string toString() const;

    /// Представление ровно с places знаками после запятой
    std::string toFixed(uint32_t places, RoundingMode mode = RoundingMode::HALF_EVEN) const;

private:
    Coefficient coefficient_ = 0;
    uint32_t scale_ = 0;

    Decimal rescaled(uint32_t scale) const;
};

inline std::ostream& operator<<(std::ostream& os, const Decimal& value) {
    return os << value.toString();
}

/**
 * @brief Контекст десятичной арифметики
 *
 * Точность (значащие цифры) и режим округления. Передаётся явно
 * в каждый компонент, который считает, вместо глобальной настройки.
 */
class DecimalContext {
public:
    static constexpr uint32_t DEFAULT_PRECISION = 28;

    explicit DecimalContext(uint32_t precision = DEFAULT_PRECISION,
                            RoundingMode rounding = RoundingMode::HALF_EVEN);

    uint32_t precision() const { return precision_; }
    RoundingMode rounding() const { return rounding_; }

    /**
     * @brief Привести значение к рабочей точности
     *
     * Округляет до precision значащих цифр, но не отбрасывает
     * цифры целой части.
     */
    Decimal apply(const Decimal& value) const;

    Decimal add(const Decimal& a, const Decimal& b) const { return apply(a + b); }
    Decimal subtract(const Decimal& a, const Decimal& b) const { return apply(a - b); }
    Decimal multiply(const Decimal& a, const Decimal& b) const { return apply(a * b); }

    /// Округление на границе вывода (деньги — 2 знака)
    Decimal quantize(const Decimal& value, uint32_t places) const {
        return value.roundTo(places, rounding_);
    }

private:
    uint32_t precision_;
    RoundingMode rounding_;
};

} // namespace settlement::domain
