#pragma once

#include <string>
#include <stdexcept>

namespace budget::domain {

/**
 * @brief Категория счёта
 *
 * Категория дочернего счёта всегда совпадает с категорией корня его дерева.
 */
enum class AccountCategory {
    INCOME,     ///< Доходы
    EXPENSE,    ///< Расходы
    SAVINGS,    ///< Накопления
    DEBT        ///< Долги
};

inline std::string toString(AccountCategory category) {
    switch (category) {
        case AccountCategory::INCOME:  return "INCOME";
        case AccountCategory::EXPENSE: return "EXPENSE";
        case AccountCategory::SAVINGS: return "SAVINGS";
        case AccountCategory::DEBT:    return "DEBT";
    }
    return "UNKNOWN";
}

/**
 * @brief Создать из строки (регистр не важен: "income" == "INCOME")
 * @throws std::invalid_argument если строка не распознана
 */
inline AccountCategory accountCategoryFromString(const std::string& str) {
    std::string upper;
    for (char c : str) {
        upper += static_cast<char>(c >= 'a' && c <= 'z' ? c - 'a' + 'A' : c);
    }
    if (upper == "INCOME")  return AccountCategory::INCOME;
    if (upper == "EXPENSE") return AccountCategory::EXPENSE;
    if (upper == "SAVINGS") return AccountCategory::SAVINGS;
    if (upper == "DEBT")    return AccountCategory::DEBT;
    throw std::invalid_argument("Unknown AccountCategory: " + str);
}

inline std::string getDisplayName(AccountCategory category) {
    switch (category) {
        case AccountCategory::INCOME:  return "Доходы";
        case AccountCategory::EXPENSE: return "Расходы";
        case AccountCategory::SAVINGS: return "Накопления";
        case AccountCategory::DEBT:    return "Долги";
    }
    return "Неизвестно";
}

} // namespace budget::domain
