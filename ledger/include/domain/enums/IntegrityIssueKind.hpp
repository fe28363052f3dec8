#pragma once

#include <string>

namespace budget::domain {

/**
 * @brief Тип структурной проблемы, найденной проверкой целостности
 */
enum class IntegrityIssueKind {
    MISSING_OWNER,      ///< Счёт без владельца
    ROOT_WITH_PARENT,   ///< Корневой счёт с родителем
    DANGLING_PARENT,    ///< Родитель не существует или чужой
    CYCLE,              ///< Цикл в цепочке родителей
    CATEGORY_MISMATCH,  ///< Категория не совпадает с родительской
    BALANCE_DRIFT       ///< Кэш баланса расходится с журналом
};

inline std::string toString(IntegrityIssueKind kind) {
    switch (kind) {
        case IntegrityIssueKind::MISSING_OWNER:     return "MISSING_OWNER";
        case IntegrityIssueKind::ROOT_WITH_PARENT:  return "ROOT_WITH_PARENT";
        case IntegrityIssueKind::DANGLING_PARENT:   return "DANGLING_PARENT";
        case IntegrityIssueKind::CYCLE:             return "CYCLE";
        case IntegrityIssueKind::CATEGORY_MISMATCH: return "CATEGORY_MISMATCH";
        case IntegrityIssueKind::BALANCE_DRIFT:     return "BALANCE_DRIFT";
    }
    return "UNKNOWN";
}

} // namespace budget::domain
