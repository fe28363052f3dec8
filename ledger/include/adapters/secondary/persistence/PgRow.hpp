#pragma once

#include "domain/Date.hpp"
#include "domain/Money.hpp"
#include "domain/Rate.hpp"
#include "domain/Timestamp.hpp"
#include <pqxx/pqxx>
#include <optional>
#include <string>

namespace budget::adapters::secondary::pg {

/**
 * @brief Разбор колонок ledger-таблиц
 *
 * Деньги хранятся парой колонок <name>_units BIGINT и <name>_nano INTEGER,
 * ставки одной колонкой <name>_nanos BIGINT, время в миллисекундах Unix.
 */

inline domain::Money money(const pqxx::row& row, const std::string& column) {
    return domain::Money(
        row[column + "_units"].as<int64_t>(),
        row[column + "_nano"].as<int32_t>());
}

inline std::optional<domain::Money> optionalMoney(const pqxx::row& row, const std::string& column) {
    if (row[column + "_units"].is_null()) {
        return std::nullopt;
    }
    return money(row, column);
}

inline domain::Rate rate(const pqxx::row& row, const std::string& column) {
    return domain::Rate::fromNanos(row[column + "_nanos"].as<int64_t>());
}

inline std::optional<std::string> optionalString(const pqxx::row& row, const char* column) {
    return row[column].is_null() ? std::nullopt : std::optional<std::string>(row[column].as<std::string>());
}

inline std::string text(const pqxx::row& row, const char* column) {
    return row[column].is_null() ? std::string() : row[column].as<std::string>();
}

inline domain::Timestamp timestamp(const pqxx::row& row, const char* column) {
    return domain::Timestamp::fromUnixMillis(row[column].as<int64_t>());
}

/**
 * @brief DATE колонка в ISO формате (DateStyle по умолчанию)
 */
inline domain::Date date(const pqxx::row& row, const char* column) {
    return domain::Date::fromString(row[column].as<std::string>());
}

inline std::optional<int64_t> optionalUnits(const std::optional<domain::Money>& value) {
    return value ? std::optional<int64_t>(value->units) : std::nullopt;
}

inline std::optional<int32_t> optionalNano(const std::optional<domain::Money>& value) {
    return value ? std::optional<int32_t>(value->nano) : std::nullopt;
}

} // namespace budget::adapters::secondary::pg
