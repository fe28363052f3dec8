#pragma once

#include "ports/input/ITemplateService.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "ports/output/ITemplateRepository.hpp"
#include "domain/LedgerError.hpp"
#include "utils/UuidGenerator.hpp"
#include <OwnerLockRegistry.hpp>
#include <algorithm>
#include <iostream>
#include <memory>

namespace budget::application {

/**
 * @brief Управление шаблонами бюджета
 */
class TemplateService : public ports::input::ITemplateService {
public:
    TemplateService(
        std::shared_ptr<ports::output::ITemplateRepository> templateRepository,
        std::shared_ptr<ports::output::IAccountRepository> accountRepository,
        std::shared_ptr<OwnerLockRegistry> locks
    ) : templateRepository_(std::move(templateRepository))
      , accountRepository_(std::move(accountRepository))
      , locks_(std::move(locks))
    {
        std::cout << "[TemplateService] Created" << std::endl;
    }

    domain::BudgetTemplate createTemplate(
        const std::string& ownerId, const domain::TemplateRequest& request) override {
        auto lock = locks_->lockExclusive(ownerId);

        requireDestination(ownerId, request.destinationAccountId);
        domain::validateRule(request.rule);

        domain::BudgetTemplate budgetTemplate(
            utils::UuidGenerator::generate(), ownerId,
            request.destinationAccountId, request.rule, request.priority);
        budgetTemplate.active = request.active;
        budgetTemplate.notes = request.notes;

        auto stored = templateRepository_->add(budgetTemplate);
        std::cout << "[TemplateService] Created " << domain::ruleTypeName(stored.rule)
                  << " template " << stored.id << " (priority " << stored.priority << ")" << std::endl;
        return stored;
    }

    domain::BudgetTemplate updateTemplate(
        const std::string& ownerId,
        const std::string& templateId,
        const domain::TemplateUpdate& update
    ) override {
        auto lock = locks_->lockExclusive(ownerId);

        auto budgetTemplate = requireTemplate(ownerId, templateId);
        if (update.destinationAccountId) {
            requireDestination(ownerId, *update.destinationAccountId);
            budgetTemplate.destinationAccountId = *update.destinationAccountId;
        }
        if (update.rule) {
            domain::validateRule(*update.rule);
            budgetTemplate.rule = *update.rule;
        }
        if (update.priority) {
            budgetTemplate.priority = *update.priority;
        }
        if (update.active) {
            budgetTemplate.active = *update.active;
        }
        if (update.notes) {
            budgetTemplate.notes = *update.notes;
        }

        store(budgetTemplate);
        std::cout << "[TemplateService] Updated template " << templateId << std::endl;
        return budgetTemplate;
    }

    domain::BudgetTemplate setTemplateActive(
        const std::string& ownerId, const std::string& templateId, bool active) override {
        auto lock = locks_->lockExclusive(ownerId);

        auto budgetTemplate = requireTemplate(ownerId, templateId);
        budgetTemplate.active = active;
        store(budgetTemplate);

        std::cout << "[TemplateService] Template " << templateId
                  << (active ? " activated" : " deactivated") << std::endl;
        return budgetTemplate;
    }

    void deleteTemplate(const std::string& ownerId, const std::string& templateId) override {
        auto lock = locks_->lockExclusive(ownerId);

        requireTemplate(ownerId, templateId);
        if (!templateRepository_->deleteById(templateId)) {
            throw domain::UnknownTemplate(templateId);
        }
        std::cout << "[TemplateService] Deleted template " << templateId << std::endl;
    }

    std::optional<domain::BudgetTemplate> getTemplate(
        const std::string& ownerId, const std::string& templateId) override {
        auto lock = locks_->lockShared(ownerId);

        auto budgetTemplate = templateRepository_->findById(templateId);
        if (!budgetTemplate || budgetTemplate->ownerId != ownerId) {
            return std::nullopt;
        }
        return budgetTemplate;
    }

    std::vector<domain::BudgetTemplate> listTemplates(const std::string& ownerId, bool activeOnly) override {
        auto lock = locks_->lockShared(ownerId);

        auto templates = templateRepository_->findByOwner(ownerId);
        if (activeOnly) {
            templates.erase(std::remove_if(templates.begin(), templates.end(),
                [](const domain::BudgetTemplate& t) { return !t.active; }), templates.end());
        }
        std::stable_sort(templates.begin(), templates.end(), domain::runsBefore);
        return templates;
    }

private:
    std::shared_ptr<ports::output::ITemplateRepository> templateRepository_;
    std::shared_ptr<ports::output::IAccountRepository> accountRepository_;
    std::shared_ptr<OwnerLockRegistry> locks_;

    void requireDestination(const std::string& ownerId, const std::string& accountId) {
        auto account = accountRepository_->findById(accountId);
        if (!account || account->ownerId != ownerId) {
            throw domain::UnknownAccount(accountId);
        }
    }

    domain::BudgetTemplate requireTemplate(const std::string& ownerId, const std::string& templateId) {
        auto budgetTemplate = templateRepository_->findById(templateId);
        if (!budgetTemplate || budgetTemplate->ownerId != ownerId) {
            throw domain::UnknownTemplate(templateId);
        }
        return *budgetTemplate;
    }

    void store(const domain::BudgetTemplate& budgetTemplate) {
        if (!templateRepository_->update(budgetTemplate)) {
            throw domain::UnknownTemplate(budgetTemplate.id);
        }
    }
};

} // namespace budget::application
