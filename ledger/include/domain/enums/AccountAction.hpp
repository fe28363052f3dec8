#pragma once

#include <string>
#include <stdexcept>

namespace budget::domain {

/**
 * @brief Действие в журнале изменений счёта
 */
enum class AccountAction {
    CREATED,
    RENAMED,
    MOVED,
    ACTIVATED,
    DEACTIVATED
};

inline std::string toString(AccountAction action) {
    switch (action) {
        case AccountAction::CREATED:     return "CREATED";
        case AccountAction::RENAMED:     return "RENAMED";
        case AccountAction::MOVED:       return "MOVED";
        case AccountAction::ACTIVATED:   return "ACTIVATED";
        case AccountAction::DEACTIVATED: return "DEACTIVATED";
    }
    return "UNKNOWN";
}

inline AccountAction accountActionFromString(const std::string& str) {
    if (str == "CREATED")     return AccountAction::CREATED;
    if (str == "RENAMED")     return AccountAction::RENAMED;
    if (str == "MOVED")       return AccountAction::MOVED;
    if (str == "ACTIVATED")   return AccountAction::ACTIVATED;
    if (str == "DEACTIVATED") return AccountAction::DEACTIVATED;
    throw std::invalid_argument("Unknown AccountAction: " + str);
}

} // namespace budget::domain
