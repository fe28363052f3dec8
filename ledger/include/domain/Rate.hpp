#pragma once

#include <cmath>
#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>

namespace budget::domain {

namespace detail {

constexpr int64_t NANO_SCALE = 1000000000;

/**
 * @throws std::invalid_argument если результат не помещается в int64
 */
inline int64_t checkedAdd(int64_t a, int64_t b, const char* what) {
    int64_t result = 0;
    if (__builtin_add_overflow(a, b, &result)) {
        throw std::invalid_argument(std::string(what) + " out of range");
    }
    return result;
}

inline int64_t checkedSub(int64_t a, int64_t b, const char* what) {
    int64_t result = 0;
    if (__builtin_sub_overflow(a, b, &result)) {
        throw std::invalid_argument(std::string(what) + " out of range");
    }
    return result;
}

inline int64_t checkedMul(int64_t a, int64_t b, const char* what) {
    int64_t result = 0;
    if (__builtin_mul_overflow(a, b, &result)) {
        throw std::invalid_argument(std::string(what) + " out of range");
    }
    return result;
}

/**
 * @brief Сузить 128-битное произведение до int64
 */
inline int64_t narrow(__int128 value, const char* what) {
    if (value > INT64_MAX || value < INT64_MIN) {
        throw std::invalid_argument(std::string(what) + " out of range");
    }
    return static_cast<int64_t>(value);
}

/**
 * @brief Масштабировать double в целые единицы с округлением
 * @throws std::invalid_argument для NaN, бесконечности и значений вне int64
 */
inline int64_t scaleDouble(double value, double scale, const char* what) {
    double scaled = std::round(value * scale);
    // 2^63 точно представимо в double, INT64_MAX нет
    if (!std::isfinite(scaled) || scaled >= 9223372036854775808.0 || scaled < -9223372036854775808.0) {
        throw std::invalid_argument(std::string(what) + " out of range");
    }
    return static_cast<int64_t>(scaled);
}

/**
 * @brief Разобрать десятичную строку в нано-единицы
 * @throws std::invalid_argument при неверном формате
 */
inline int64_t parseNanos(const std::string& raw, const char* what) {
    if (raw.empty()) {
        throw std::invalid_argument(std::string("Empty ") + what + " value");
    }

    size_t pos = 0;
    bool negative = false;
    if (raw[pos] == '-' || raw[pos] == '+') {
        negative = raw[pos] == '-';
        ++pos;
    }

    int64_t whole = 0;
    size_t wholeDigits = 0;
    while (pos < raw.size() && raw[pos] >= '0' && raw[pos] <= '9') {
        whole = whole * 10 + (raw[pos] - '0');
        if (whole > INT64_MAX / NANO_SCALE) {
            throw std::invalid_argument(std::string(what) + " out of range: " + raw);
        }
        ++pos;
        ++wholeDigits;
    }

    int64_t fraction = 0;
    size_t fractionDigits = 0;
    if (pos < raw.size() && raw[pos] == '.') {
        ++pos;
        while (pos < raw.size() && raw[pos] >= '0' && raw[pos] <= '9') {
            if (fractionDigits == 9) {
                throw std::invalid_argument(std::string(what) + " has more than 9 fractional digits: " + raw);
            }
            fraction = fraction * 10 + (raw[pos] - '0');
            ++pos;
            ++fractionDigits;
        }
    }

    if (pos != raw.size() || (wholeDigits == 0 && fractionDigits == 0)) {
        throw std::invalid_argument(std::string("Invalid ") + what + " value: " + raw);
    }

    for (size_t i = fractionDigits; i < 9; ++i) {
        fraction *= 10;
    }

    int64_t nanos = 0;
    if (__builtin_mul_overflow(whole, NANO_SCALE, &nanos) || __builtin_add_overflow(nanos, fraction, &nanos)) {
        throw std::invalid_argument(std::string(what) + " out of range: " + raw);
    }
    return negative ? -nanos : nanos;
}

/**
 * @brief Нано-единицы в десятичную строку без хвостовых нулей
 * @param minFraction Минимум знаков после точки
 */
inline std::string formatNanos(int64_t nanos, size_t minFraction) {
    bool negative = nanos < 0;
    uint64_t magnitude = negative ? static_cast<uint64_t>(-(nanos + 1)) + 1 : static_cast<uint64_t>(nanos);

    std::string whole = std::to_string(magnitude / NANO_SCALE);
    std::string fraction = std::to_string(magnitude % NANO_SCALE);
    fraction = std::string(9 - fraction.size(), '0') + fraction;

    while (fraction.size() > minFraction && fraction.back() == '0') {
        fraction.pop_back();
    }

    std::string result = negative ? "-" : "";
    result += whole;
    if (!fraction.empty()) {
        result += "." + fraction;
    }
    return result;
}

} // namespace detail

/**
 * @brief Безразмерный десятичный коэффициент
 *
 * Ставка процента за период, процент шаблона, доля автопогашения.
 * Точность 10^-9, как у Money.
 */
struct Rate {
    int64_t nanos = 0;

    Rate() = default;

    static Rate fromNanos(int64_t n) {
        Rate r;
        r.nanos = n;
        return r;
    }

    /**
     * @throws std::invalid_argument при неверном формате
     */
    static Rate fromString(const std::string& str) {
        return fromNanos(detail::parseNanos(str, "Rate"));
    }

    /**
     * @throws std::invalid_argument если значение не помещается в int64 нано-единиц
     */
    static Rate fromDouble(double value) {
        return fromNanos(detail::scaleDouble(value, static_cast<double>(detail::NANO_SCALE), "Rate"));
    }

    static Rate zero() { return Rate(); }

    std::string toString() const { return detail::formatNanos(nanos, 0); }

    double toDouble() const {
        return static_cast<double>(nanos) / static_cast<double>(detail::NANO_SCALE);
    }

    bool isNegative() const { return nanos < 0; }
    bool isZero() const { return nanos == 0; }

    bool operator==(const Rate& other) const { return nanos == other.nanos; }
    bool operator!=(const Rate& other) const { return nanos != other.nanos; }
    bool operator<(const Rate& other) const { return nanos < other.nanos; }
    bool operator>(const Rate& other) const { return nanos > other.nanos; }
    bool operator<=(const Rate& other) const { return nanos <= other.nanos; }
    bool operator>=(const Rate& other) const { return nanos >= other.nanos; }
};

inline std::ostream& operator<<(std::ostream& os, const Rate& rate) {
    return os << rate.toString();
}

inline void PrintTo(const Rate& rate, std::ostream* os) {
    *os << rate.toString();
}

} // namespace budget::domain
