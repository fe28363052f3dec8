#pragma once

#include "enums/AccountAction.hpp"
#include "Timestamp.hpp"
#include <string>

namespace budget::domain {

/**
 * @brief Запись журнала изменений счёта
 */
struct AccountEvent {
    std::string id;
    std::string accountId;
    std::string ownerId;
    AccountAction action = AccountAction::CREATED;
    std::string oldValue;
    std::string newValue;
    Timestamp timestamp;

    AccountEvent() = default;

    AccountEvent(
        const std::string& id,
        const std::string& accountId,
        const std::string& ownerId,
        AccountAction action,
        const std::string& oldValue = "",
        const std::string& newValue = ""
    ) : id(id), accountId(accountId), ownerId(ownerId), action(action),
        oldValue(oldValue), newValue(newValue), timestamp(Timestamp::now()) {}
};

} // namespace budget::domain
