#pragma once

#include "domain/Allocation.hpp"
#include <string>
#include <optional>
#include <vector>

namespace budget::ports::output {

/**
 * @brief Интерфейс репозитория распределений
 */
class IAllocationRepository {
public:
    virtual ~IAllocationRepository() = default;

    /**
     * @brief Сохранить распределение (вставка или обновление)
     */
    virtual void save(const domain::Allocation& allocation) = 0;

    virtual std::optional<domain::Allocation> findById(const std::string& id) = 0;

    /**
     * @brief Распределения владельца за период, в порядке создания
     */
    virtual std::vector<domain::Allocation> findByPeriod(
        const std::string& ownerId, const std::string& periodId) = 0;

    virtual std::vector<domain::Allocation> findByOwner(const std::string& ownerId) = 0;
};

} // namespace budget::ports::output
