#pragma once

#include "domain/OwnerSettings.hpp"
#include <string>
#include <optional>

namespace budget::ports::output {

/**
 * @brief Интерфейс хранилища настроек владельцев
 */
class ISettingsRepository {
public:
    virtual ~ISettingsRepository() = default;

    virtual std::optional<domain::OwnerSettings> find(const std::string& ownerId) = 0;

    virtual void save(const domain::OwnerSettings& settings) = 0;
};

} // namespace budget::ports::output
