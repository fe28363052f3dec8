#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <stdexcept>
#include <string>

namespace budget::domain {

/**
 * @brief Календарная дата (без времени)
 *
 * Хранится как число дней от 1970-01-01. Формат ISO "YYYY-MM-DD".
 * День недели: 0 = понедельник ... 6 = воскресенье.
 */
struct Date {
    int64_t days = 0;

    Date() = default;

    explicit Date(int64_t daysSinceEpoch) : days(daysSinceEpoch) {}

    static Date fromCivil(int year, unsigned month, unsigned day) {
        // Алгоритм days_from_civil (Howard Hinnant)
        year -= month <= 2 ? 1 : 0;
        const int64_t era = (year >= 0 ? year : year - 399) / 400;
        const unsigned yoe = static_cast<unsigned>(year - era * 400);
        const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
        const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return Date(era * 146097 + static_cast<int64_t>(doe) - 719468);
    }

    /**
     * @brief Разобрать "YYYY-MM-DD"
     * @throws std::invalid_argument при неверном формате или дате
     */
    static Date fromString(const std::string& iso) {
        int year = 0;
        unsigned month = 0;
        unsigned day = 0;
        char tail = 0;
        if (iso.size() != 10 ||
            std::sscanf(iso.c_str(), "%4d-%2u-%2u%c", &year, &month, &day, &tail) != 3) {
            throw std::invalid_argument("Invalid date: " + iso);
        }
        if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month)) {
            throw std::invalid_argument("Invalid date: " + iso);
        }
        return fromCivil(year, month, day);
    }

    /**
     * @brief Календарный день момента unixSeconds в поясе со смещением utcOffsetMinutes
     */
    static Date fromUnixSeconds(int64_t unixSeconds, int utcOffsetMinutes = 0) {
        constexpr int64_t secondsPerDay = 24 * 60 * 60;
        int64_t local = unixSeconds + static_cast<int64_t>(utcOffsetMinutes) * 60;
        int64_t days = local / secondsPerDay;
        if (local % secondsPerDay < 0) {
            days -= 1;
        }
        return Date(days);
    }

    /**
     * @brief Сегодняшняя дата владельца; без смещения - день по UTC
     */
    static Date today(int utcOffsetMinutes = 0) {
        auto now = std::chrono::system_clock::now();
        auto seconds = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch());
        return fromUnixSeconds(seconds.count(), utcOffsetMinutes);
    }

    std::string toString() const {
        int year;
        unsigned month;
        unsigned day;
        toCivil(year, month, day);
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", year, month, day);
        return buf;
    }

    /**
     * @brief День недели, 0 = понедельник
     */
    int weekday() const {
        // 1970-01-01 был четвергом (3)
        int64_t w = (days + 3) % 7;
        return static_cast<int>(w < 0 ? w + 7 : w);
    }

    /**
     * @brief Ближайшая дата не позже текущей, приходящаяся на weekStartDay
     */
    Date startOfWeek(int weekStartDay) const {
        int shift = (weekday() - weekStartDay + 7) % 7;
        return addDays(-shift);
    }

    Date addDays(int64_t n) const { return Date(days + n); }

    int64_t daysUntil(const Date& other) const { return other.days - days; }

    bool operator==(const Date& other) const { return days == other.days; }
    bool operator!=(const Date& other) const { return days != other.days; }
    bool operator<(const Date& other) const { return days < other.days; }
    bool operator>(const Date& other) const { return days > other.days; }
    bool operator<=(const Date& other) const { return days <= other.days; }
    bool operator>=(const Date& other) const { return days >= other.days; }

private:
    static bool isLeap(int year) {
        return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    }

    static unsigned daysInMonth(int year, unsigned month) {
        static const unsigned table[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        return month == 2 && isLeap(year) ? 29 : table[month - 1];
    }

    void toCivil(int& year, unsigned& month, unsigned& day) const {
        const int64_t z = days + 719468;
        const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
        const unsigned doe = static_cast<unsigned>(z - era * 146097);
        const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        const unsigned mp = (5 * doy + 2) / 153;
        day = doy - (153 * mp + 2) / 5 + 1;
        month = mp < 10 ? mp + 3 : mp - 9;
        year = static_cast<int>(static_cast<int64_t>(yoe) + era * 400 + (month <= 2 ? 1 : 0));
    }
};

} // namespace budget::domain
