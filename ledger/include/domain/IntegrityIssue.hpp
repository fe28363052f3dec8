#pragma once

#include "enums/IntegrityIssueKind.hpp"
#include <string>
#include <vector>

namespace budget::domain {

/**
 * @brief Найденная структурная проблема
 */
struct IntegrityIssue {
    IntegrityIssueKind kind = IntegrityIssueKind::DANGLING_PARENT;
    std::string accountId;
    std::string accountName;
    std::string ownerId;
    std::string detail;
    bool fixed = false;
};

struct IntegrityReport {
    std::string ownerId;
    bool fixMode = false;
    size_t accountsChecked = 0;
    std::vector<IntegrityIssue> issues;

    bool isClean() const { return issues.empty(); }

    size_t count(IntegrityIssueKind kind) const {
        size_t n = 0;
        for (const auto& issue : issues) {
            if (issue.kind == kind) {
                ++n;
            }
        }
        return n;
    }
};

} // namespace budget::domain
