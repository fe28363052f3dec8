#pragma once

#include "domain/Allocation.hpp"
#include "domain/AllocationRun.hpp"
#include <string>
#include <vector>

namespace budget::ports::input {

/**
 * @brief Интерфейс движка распределения
 */
class IAllocationService {
public:
    virtual ~IAllocationService() = default;

    /**
     * @brief Распределить пул по активным шаблонам
     *
     * Ошибки отдельных шаблонов попадают в отчёт, прогон продолжается.
     *
     * @throws InvalidPool пул <= 0
     * @throws UnknownPeriod, UnknownAccount неверный период или источник
     */
    virtual domain::AllocationReport runAllocation(
        const std::string& ownerId, const domain::AllocationRunRequest& request) = 0;

    /**
     * @brief Ручное распределение без шаблона
     */
    virtual domain::Allocation allocateManually(
        const std::string& ownerId, const domain::ManualAllocationRequest& request) = 0;

    virtual std::vector<domain::Allocation> listAllocations(
        const std::string& ownerId, const std::string& periodId) = 0;
};

} // namespace budget::ports::input
