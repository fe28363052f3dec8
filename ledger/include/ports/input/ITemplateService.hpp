#pragma once

#include "domain/BudgetTemplate.hpp"
#include "domain/TemplateRequest.hpp"
#include <optional>
#include <string>
#include <vector>

namespace budget::ports::input {

/**
 * @brief Интерфейс управления шаблонами бюджета
 */
class ITemplateService {
public:
    virtual ~ITemplateService() = default;

    /**
     * @throws UnknownAccount счёт назначения не найден
     * @throws InvalidAmount неверное правило
     */
    virtual domain::BudgetTemplate createTemplate(
        const std::string& ownerId, const domain::TemplateRequest& request) = 0;

    virtual domain::BudgetTemplate updateTemplate(
        const std::string& ownerId,
        const std::string& templateId,
        const domain::TemplateUpdate& update
    ) = 0;

    virtual domain::BudgetTemplate setTemplateActive(
        const std::string& ownerId, const std::string& templateId, bool active) = 0;

    /**
     * @throws UnknownTemplate
     */
    virtual void deleteTemplate(const std::string& ownerId, const std::string& templateId) = 0;

    virtual std::optional<domain::BudgetTemplate> getTemplate(
        const std::string& ownerId, const std::string& templateId) = 0;

    /**
     * @brief Шаблоны в порядке обработки (priority, затем порядок создания)
     */
    virtual std::vector<domain::BudgetTemplate> listTemplates(const std::string& ownerId, bool activeOnly) = 0;
};

} // namespace budget::ports::input
