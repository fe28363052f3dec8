#pragma once

#include "ports/output/ISettingsRepository.hpp"
#include <ThreadSafeMap.hpp>

namespace budget::adapters::secondary {

/**
 * @brief In-memory хранилище настроек владельцев
 */
class InMemorySettingsRepository : public ports::output::ISettingsRepository {
public:
    std::optional<domain::OwnerSettings> find(const std::string& ownerId) override {
        auto settings = settings_.find(ownerId);
        return settings ? std::optional(*settings) : std::nullopt;
    }

    void save(const domain::OwnerSettings& settings) override {
        settings_.insert(settings.ownerId, std::make_shared<domain::OwnerSettings>(settings));
    }

private:
    ThreadSafeMap<std::string, domain::OwnerSettings> settings_;
};

} // namespace budget::adapters::secondary
