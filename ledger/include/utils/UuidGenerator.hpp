#pragma once

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace budget::utils {

/**
 * @brief Генератор идентификаторов ledger
 *
 * UUID v4 для строк в хранилище, короткие ID с префиксом для связок
 * (перевод, прогон распределения), которые видны в логах.
 *
 * @note Thread-safe благодаря thread_local генератору
 */
class UuidGenerator {
public:
    /**
     * @brief UUID v4: xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx
     */
    static std::string generate() {
        uint64_t high = engine()();
        uint64_t low = engine()();

        high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;     // version 4
        low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;       // variant 10xx

        std::ostringstream ss;
        ss << std::hex << std::setfill('0')
           << std::setw(8) << (high >> 32) << "-"
           << std::setw(4) << ((high >> 16) & 0xFFFF) << "-"
           << std::setw(4) << (high & 0xFFFF) << "-"
           << std::setw(4) << (low >> 48) << "-"
           << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
        return ss.str();
    }

    /**
     * @brief Короткий ID: "prefix-xxxxxxxxxxxx"
     */
    static std::string generateWithPrefix(const std::string& prefix) {
        std::ostringstream ss;
        ss << prefix << "-" << std::hex << std::setfill('0')
           << std::setw(12) << (engine()() & 0xFFFFFFFFFFFFULL);
        return ss.str();
    }

private:
    static std::mt19937_64& engine() {
        thread_local std::mt19937_64 gen(std::random_device{}());
        return gen;
    }
};

} // namespace budget::utils
