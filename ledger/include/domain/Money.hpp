#pragma once

#include "Rate.hpp"
#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>

namespace budget::domain {

/**
 * @brief Денежное значение с фиксированной точкой
 *
 * Хранит целую часть и дробную в нано-единицах (10^-9), nano всегда в
 * диапазоне [0, 10^9). Сложение, вычитание и сравнение точные.
 * Валюта одна на весь ledger, поэтому не хранится.
 *
 * Значение, не помещающееся в int64 нано-единиц (около 9.2 млрд),
 * не создаётся: конструкторы и арифметика бросают std::invalid_argument.
 */
class Money {
public:
    static constexpr int64_t NANOS_PER_UNIT = 1000000000;
    static constexpr int64_t NANOS_PER_CENT = 10000000;

    int64_t units = 0;      // Целая часть
    int32_t nano = 0;       // Дробная часть (10^-9)

    Money() = default;

    Money(int64_t u, int32_t n) {
        *this = fromNanos(detail::checkedAdd(detail::checkedMul(u, NANOS_PER_UNIT, "Money"), n, "Money"));
    }

    static Money fromNanos(int64_t nanos) {
        Money m;
        m.units = nanos / NANOS_PER_UNIT;
        int64_t rest = nanos % NANOS_PER_UNIT;
        if (rest < 0) {
            rest += NANOS_PER_UNIT;
            m.units -= 1;
        }
        m.nano = static_cast<int32_t>(rest);
        return m;
    }

    static Money fromCents(int64_t cents) {
        return fromNanos(detail::checkedMul(cents, NANOS_PER_CENT, "Money"));
    }

    /**
     * @brief Создать из double с округлением до центов
     *
     * Для значений, пришедших числом в JSON.
     */
    static Money fromDouble(double value) {
        return fromCents(detail::scaleDouble(value, 100.0, "Money"));
    }

    /**
     * @brief Разобрать десятичную строку ("125", "-12.5", "0.125")
     * @throws std::invalid_argument если строка не число или точнее 10^-9
     */
    static Money fromString(const std::string& str) {
        return fromNanos(detail::parseNanos(str, "Money"));
    }

    static Money zero() { return Money(); }

    int64_t toNanos() const {
        return units * NANOS_PER_UNIT + nano;
    }

    double toDouble() const {
        return static_cast<double>(toNanos()) / static_cast<double>(NANOS_PER_UNIT);
    }

    /**
     * @brief Десятичная строка, минимум два знака после точки
     */
    std::string toString() const {
        return detail::formatNanos(toNanos(), 2);
    }

    /**
     * @brief Округлить до центов (банковское округление, half-even)
     */
    Money roundedToCents() const {
        int64_t nanos = toNanos();
        int64_t cents = nanos / NANOS_PER_CENT;
        int64_t rest = nanos % NANOS_PER_CENT;
        if (rest < 0) {
            rest += NANOS_PER_CENT;
            cents -= 1;
        }
        int64_t twice = rest * 2;
        if (twice > NANOS_PER_CENT || (twice == NANOS_PER_CENT && (cents % 2 != 0))) {
            cents += 1;
        }
        return fromCents(cents);
    }

    /**
     * @brief Умножить на коэффициент (без округления до центов)
     */
    Money times(const Rate& rate) const {
        __int128 product = static_cast<__int128>(toNanos()) * rate.nanos;
        return fromNanos(detail::narrow(product / NANOS_PER_UNIT, "Money"));
    }

    /**
     * @brief Процент от суммы: this * percent / 100
     */
    Money percent(const Rate& percentValue) const {
        __int128 product = static_cast<__int128>(toNanos()) * percentValue.nanos;
        return fromNanos(detail::narrow(product / (NANOS_PER_UNIT * 100), "Money"));
    }

    bool isZero() const { return toNanos() == 0; }
    bool isPositive() const { return toNanos() > 0; }
    bool isNegative() const { return toNanos() < 0; }

    Money abs() const { return isNegative() ? -*this : *this; }

    Money operator-() const { return fromNanos(detail::checkedSub(0, toNanos(), "Money")); }

    Money operator+(const Money& other) const {
        return fromNanos(detail::checkedAdd(toNanos(), other.toNanos(), "Money"));
    }

    Money operator-(const Money& other) const {
        return fromNanos(detail::checkedSub(toNanos(), other.toNanos(), "Money"));
    }

    Money& operator+=(const Money& other) {
        *this = *this + other;
        return *this;
    }

    Money& operator-=(const Money& other) {
        *this = *this - other;
        return *this;
    }

    bool operator==(const Money& other) const { return toNanos() == other.toNanos(); }
    bool operator!=(const Money& other) const { return !(*this == other); }
    bool operator<(const Money& other) const { return toNanos() < other.toNanos(); }
    bool operator>(const Money& other) const { return toNanos() > other.toNanos(); }
    bool operator<=(const Money& other) const { return toNanos() <= other.toNanos(); }
    bool operator>=(const Money& other) const { return toNanos() >= other.toNanos(); }
};

inline Money min(const Money& a, const Money& b) { return a < b ? a : b; }
inline Money max(const Money& a, const Money& b) { return a > b ? a : b; }

inline std::ostream& operator<<(std::ostream& os, const Money& money) {
    return os << money.toString();
}

/// Печать в сообщениях gtest
inline void PrintTo(const Money& money, std::ostream* os) {
    *os << money.toString();
}

} // namespace budget::domain
