#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include <optional>
#include <string>

namespace budget::domain {

/**
 * @brief Распределение: перевод source → destination в периоде
 *
 * Ручные распределения не имеют templateId.
 */
struct Allocation {
    std::string id;
    std::string ownerId;
    std::optional<std::string> templateId;
    std::string sourceAccountId;
    std::string destinationAccountId;
    std::string periodId;
    Money amount;
    bool processed = false;
    bool partiallyFunded = false;
    bool reversed = false;          ///< Сторнировано при повторной обработке периода
    std::string debitTransactionId;
    std::string creditTransactionId;
    std::string notes;
    Timestamp createdAt;

    Allocation() = default;

    Allocation(
        const std::string& id,
        const std::string& ownerId,
        const std::optional<std::string>& templateId,
        const std::string& sourceAccountId,
        const std::string& destinationAccountId,
        const std::string& periodId,
        const Money& amount
    ) : id(id), ownerId(ownerId), templateId(templateId),
        sourceAccountId(sourceAccountId), destinationAccountId(destinationAccountId),
        periodId(periodId), amount(amount), createdAt(Timestamp::now()) {}

    bool isManual() const { return !templateId.has_value(); }
};

/**
 * @brief Запрос ручного распределения
 */
struct ManualAllocationRequest {
    std::string sourceAccountId;
    std::string destinationAccountId;
    std::string periodId;
    Money amount;
    std::string notes;
};

} // namespace budget::domain
