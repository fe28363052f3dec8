#pragma once

#include "domain/IntegrityIssue.hpp"
#include <string>

namespace budget::ports::input {

/**
 * @brief Проверка структурной целостности данных владельца
 */
class IIntegrityService {
public:
    virtual ~IIntegrityService() = default;

    /**
     * @brief Найти проблемы; при fix = true исправить их
     */
    virtual domain::IntegrityReport validateIntegrity(const std::string& ownerId, bool fix) = 0;
};

} // namespace budget::ports::input
