#pragma once

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

/**
 * @file OwnerLockRegistry.hpp
 * @brief Реестр блокировок в разрезе владельца (tenant)
 */

/**
 * @brief Выдаёт по одному std::shared_mutex на владельца
 *
 * Команды над данными владельца берут эксклюзивную блокировку,
 * запросы берут разделяемую. Мьютексы владельцев живут столько же,
 * сколько реестр, поэтому возвращённые блокировки не висят.
 */
class OwnerLockRegistry {
public:
    OwnerLockRegistry() = default;

    OwnerLockRegistry(const OwnerLockRegistry&) = delete;
    OwnerLockRegistry& operator=(const OwnerLockRegistry&) = delete;

    /**
     * @brief Эксклюзивная блокировка (запись)
     */
    std::unique_lock<std::shared_mutex> lockExclusive(const std::string& ownerId) {
        return std::unique_lock<std::shared_mutex>(mutexFor(ownerId));
    }

    /**
     * @brief Разделяемая блокировка (чтение)
     */
    std::shared_lock<std::shared_mutex> lockShared(const std::string& ownerId) {
        return std::shared_lock<std::shared_mutex>(mutexFor(ownerId));
    }

    /**
     * @brief Количество владельцев, для которых созданы мьютексы
     */
    size_t size() const {
        std::lock_guard<std::mutex> lock(registryMutex_);
        return mutexes_.size();
    }

private:
    std::shared_mutex& mutexFor(const std::string& ownerId) {
        std::lock_guard<std::mutex> lock(registryMutex_);
        auto& slot = mutexes_[ownerId];
        if (!slot) {
            slot = std::make_unique<std::shared_mutex>();
        }
        return *slot;
    }

    mutable std::mutex registryMutex_;
    std::unordered_map<std::string, std::unique_ptr<std::shared_mutex>> mutexes_;
};
