#pragma once

#include "domain/BudgetTemplate.hpp"
#include <string>
#include <optional>
#include <vector>

namespace budget::ports::output {

/**
 * @brief Интерфейс репозитория шаблонов бюджета
 */
class ITemplateRepository {
public:
    virtual ~ITemplateRepository() = default;

    /**
     * @brief Добавить новый шаблон
     *
     * @return Шаблон с назначенным creationOrder
     */
    virtual domain::BudgetTemplate add(const domain::BudgetTemplate& budgetTemplate) = 0;

    /**
     * @return false если шаблон не найден
     */
    virtual bool update(const domain::BudgetTemplate& budgetTemplate) = 0;

    virtual std::optional<domain::BudgetTemplate> findById(const std::string& id) = 0;

    virtual std::vector<domain::BudgetTemplate> findByOwner(const std::string& ownerId) = 0;

    virtual bool deleteById(const std::string& id) = 0;
};

} // namespace budget::ports::output
