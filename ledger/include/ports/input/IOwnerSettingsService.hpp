#pragma once

#include "domain/OwnerSettings.hpp"
#include <string>

namespace budget::ports::input {

/**
 * @brief Настройки бюджета владельца
 */
class IOwnerSettingsService {
public:
    virtual ~IOwnerSettingsService() = default;

    /**
     * @brief Сохранённые настройки или значения по умолчанию из конфигурации
     */
    virtual domain::OwnerSettings getSettings(const std::string& ownerId) = 0;

    /**
     * @throws InvalidArgument день недели вне 0..6, отрицательная ставка или порог
     */
    virtual domain::OwnerSettings updateSettings(const domain::OwnerSettings& settings) = 0;

    /**
     * @brief Текущая дата в поясе владельца (utcOffsetMinutes)
     */
    virtual domain::Date today(const std::string& ownerId) = 0;
};

} // namespace budget::ports::input
