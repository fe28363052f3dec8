#pragma once

#include "Date.hpp"
#include "Timestamp.hpp"
#include <string>

namespace budget::domain {

/**
 * @brief Недельный учётный период [startDate, endDate)
 *
 * endDate не входит в период и всегда равен startDate + 7.
 * Признак "текущий" не хранится, а вычисляется по переданной дате.
 */
struct WeeklyPeriod {
    static constexpr int LENGTH_DAYS = 7;

    std::string id;
    std::string ownerId;
    Date startDate;
    Date endDate;
    Timestamp createdAt;

    WeeklyPeriod() = default;

    WeeklyPeriod(const std::string& id, const std::string& ownerId, const Date& start)
        : id(id), ownerId(ownerId), startDate(start),
          endDate(start.addDays(LENGTH_DAYS)), createdAt(Timestamp::now()) {}

    bool contains(const Date& date) const {
        return date >= startDate && date < endDate;
    }

    bool isCurrent(const Date& today) const { return contains(today); }

    bool overlaps(const Date& from, const Date& to) const {
        return startDate < to && from < endDate;
    }
};

/**
 * @brief Диапазон периодов по дате начала: [from, to)
 */
struct PeriodRange {
    Date from;
    Date to;

    bool includes(const Date& periodStart) const {
        return periodStart >= from && periodStart < to;
    }
};

} // namespace budget::domain
