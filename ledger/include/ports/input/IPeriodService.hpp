#pragma once

#include "domain/Date.hpp"
#include "domain/WeeklyPeriod.hpp"
#include <Sequence.hpp>
#include <optional>
#include <string>
#include <vector>

namespace budget::ports::input {

/**
 * @brief Интерфейс менеджера недельных периодов
 */
class IPeriodService {
public:
    virtual ~IPeriodService() = default;

    /**
     * @brief Задать эпоху владельца и создать первый период
     *
     * Начало первого периода - эпоха, сдвинутая назад к началу недели.
     * Если периоды уже есть, возвращает первый из них.
     */
    virtual domain::WeeklyPeriod openLedger(const std::string& ownerId, const domain::Date& epoch) = 0;

    /**
     * @brief Период, содержащий дату
     *
     * Недостающие периоды после последнего создаются атомарно.
     *
     * @throws PeriodGapError нет периодов и эпохи, или дата раньше первого периода
     */
    virtual domain::WeeklyPeriod currentPeriod(const std::string& ownerId, const domain::Date& now) = 0;

    /**
     * @brief Ленивая перезапускаемая последовательность периодов, пересекающих [start, end)
     */
    virtual Sequence<domain::WeeklyPeriod> periodsInRange(
        const std::string& ownerId,
        const domain::Date& start,
        const domain::Date& end
    ) = 0;

    virtual std::optional<domain::WeeklyPeriod> getPeriod(const std::string& ownerId, const std::string& periodId) = 0;

    virtual std::vector<domain::WeeklyPeriod> listPeriods(const std::string& ownerId) = 0;
};

} // namespace budget::ports::input
