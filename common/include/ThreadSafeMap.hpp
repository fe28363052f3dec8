#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

/**
 * @brief Потокобезопасная хеш-таблица значений, разделяемых через shared_ptr
 *
 * Чтение идёт под shared_lock, запись под unique_lock.
 * Хранилище для in-memory репозиториев.
 */
template <typename K, typename V>
class ThreadSafeMap
{
public:
    ThreadSafeMap() = default;

    void insert(const K &key, const std::shared_ptr<V> &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_[key] = value;
    }

    /**
     * @brief Вставить пачку значений одной операцией
     *
     * Читатели видят либо все значения пачки, либо ни одного.
     */
    void insertAll(const std::vector<std::pair<K, std::shared_ptr<V>>> &entries)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        for (const auto &entry : entries)
        {
            map_[entry.first] = entry.second;
        }
    }

    std::shared_ptr<V> find(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        return (it != map_.end()) ? it->second : nullptr;
    }

    bool contains(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.find(key) != map_.end();
    }

    bool remove(const K &key)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return map_.erase(key) > 0;
    }

    /**
     * @brief Заменить значение по ключу, если оно есть
     *
     * @param mutator Получает копию текущего значения, возвращает новое
     * @return false если ключа нет
     */
    bool update(const K &key, const std::function<V(const V &)> &mutator)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end() || !it->second)
        {
            return false;
        }
        it->second = std::make_shared<V>(mutator(*it->second));
        return true;
    }

    /**
     * @brief Снимок значений, удовлетворяющих предикату
     */
    std::vector<std::shared_ptr<V>> values(const std::function<bool(const V &)> &predicate = nullptr) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<std::shared_ptr<V>> result;
        result.reserve(map_.size());
        for (const auto &entry : map_)
        {
            if (entry.second && (!predicate || predicate(*entry.second)))
            {
                result.push_back(entry.second);
            }
        }
        return result;
    }

    size_t size() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.size();
    }

    void clear()
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_.clear();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<K, std::shared_ptr<V>> map_;
};
