#pragma once

#include "domain/Date.hpp"
#include "domain/WeeklyPeriod.hpp"
#include <string>
#include <optional>
#include <vector>

namespace budget::ports::output {

/**
 * @brief Интерфейс репозитория недельных периодов
 */
class IPeriodRepository {
public:
    virtual ~IPeriodRepository() = default;

    /**
     * @brief Сохранить пачку периодов атомарно
     *
     * Используется при достройке цепочки периодов: либо все, либо ни одного.
     */
    virtual void saveAll(const std::vector<domain::WeeklyPeriod>& periods) = 0;

    virtual std::optional<domain::WeeklyPeriod> findById(const std::string& id) = 0;

    /**
     * @brief Все периоды владельца по возрастанию даты начала
     */
    virtual std::vector<domain::WeeklyPeriod> findByOwner(const std::string& ownerId) = 0;

    /**
     * @brief Период, содержащий дату
     */
    virtual std::optional<domain::WeeklyPeriod> findContaining(
        const std::string& ownerId, const domain::Date& date) = 0;

    virtual std::optional<domain::WeeklyPeriod> findByStart(
        const std::string& ownerId, const domain::Date& startDate) = 0;

    virtual std::optional<domain::WeeklyPeriod> findEarliest(const std::string& ownerId) = 0;

    virtual std::optional<domain::WeeklyPeriod> findLatest(const std::string& ownerId) = 0;
};

} // namespace budget::ports::output
