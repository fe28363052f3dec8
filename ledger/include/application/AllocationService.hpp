#pragma once

#include "ports/input/IAllocationService.hpp"
#include "ports/output/IAllocationRepository.hpp"
#include "ports/output/ITemplateRepository.hpp"
#include "application/LedgerPosting.hpp"
#include "domain/BudgetTemplate.hpp"
#include "domain/LedgerError.hpp"
#include "utils/UuidGenerator.hpp"
#include <OwnerLockRegistry.hpp>
#include <algorithm>
#include <iostream>
#include <map>
#include <memory>

namespace budget::application {

/**
 * @brief Движок распределения пула по шаблонам
 *
 * Шаблоны обрабатываются по priority, затем по порядку создания.
 * Каждое ненулевое распределение проводится переводом source → destination.
 *
 * Повторный прогон за тот же период не распределяет шаблон второй раз:
 * прежняя сумма учитывается в пуле, шаблон отмечается как уже обработанный.
 * При reprocess прежние распределения периода сначала сторнируются.
 */
class AllocationService : public ports::input::IAllocationService {
public:
    AllocationService(
        std::shared_ptr<LedgerPosting> posting,
        std::shared_ptr<ports::output::ITemplateRepository> templateRepository,
        std::shared_ptr<ports::output::IAllocationRepository> allocationRepository,
        std::shared_ptr<OwnerLockRegistry> locks
    ) : posting_(std::move(posting))
      , templateRepository_(std::move(templateRepository))
      , allocationRepository_(std::move(allocationRepository))
      , locks_(std::move(locks))
    {
        std::cout << "[AllocationService] Created" << std::endl;
    }

    domain::AllocationReport runAllocation(
        const std::string& ownerId, const domain::AllocationRunRequest& request) override {
        if (!request.pool.isPositive()) {
            throw domain::InvalidPool("Allocation pool must be positive, got " + request.pool.toString());
        }

        auto lock = locks_->lockExclusive(ownerId);

        auto period = posting_->requirePeriod(ownerId, request.periodId);
        auto source = posting_->requireAccount(ownerId, request.sourceAccountId);
        if (!source.active) {
            throw domain::InvalidState("Source account " + source.name + " is inactive");
        }

        domain::AllocationReport report;
        report.periodId = period.id;
        report.sourceAccountId = source.id;
        report.pool = request.pool;

        auto templates = templateRepository_->findByOwner(ownerId);
        templates.erase(std::remove_if(templates.begin(), templates.end(),
            [](const domain::BudgetTemplate& t) { return !t.active; }), templates.end());
        std::stable_sort(templates.begin(), templates.end(), domain::runsBefore);

        std::map<std::string, domain::Allocation> previous;
        for (const auto& allocation : allocationRepository_->findByPeriod(ownerId, period.id)) {
            if (allocation.templateId && allocation.processed && !allocation.reversed) {
                previous[*allocation.templateId] = allocation;
            }
        }

        if (request.reprocess) {
            for (auto& entry : previous) {
                reverseAllocation(ownerId, period.id, entry.second);
                ++report.reversedAllocations;
            }
            previous.clear();
        }

        for (const auto& entry : previous) {
            report.totalAllocated += entry.second.amount;
        }
        domain::Money remaining = domain::max(request.pool - report.totalAllocated, domain::Money::zero());

        // Прежние распределения шаблонов, которые сейчас выключены, тоже попадают в отчёт
        for (const auto& entry : previous) {
            bool stillActive = std::any_of(templates.begin(), templates.end(),
                [&entry](const domain::BudgetTemplate& t) { return t.id == entry.first; });
            if (!stillActive) {
                report.outcomes.push_back(alreadyProcessed(entry.second));
            }
        }

        for (const auto& budgetTemplate : templates) {
            auto prior = previous.find(budgetTemplate.id);
            if (prior != previous.end()) {
                report.outcomes.push_back(alreadyProcessed(prior->second));
                continue;
            }

            auto outcome = allocateTemplate(ownerId, period.id, source.id, budgetTemplate, request.pool, remaining);
            if (domain::isFunded(outcome.status)) {
                remaining -= outcome.allocated;
                report.totalAllocated += outcome.allocated;
            }
            report.outcomes.push_back(outcome);
        }

        report.remainingPool = domain::max(request.pool - report.totalAllocated, domain::Money::zero());

        std::cout << "[AllocationService] Run for period " << period.startDate.toString()
                  << ": pool " << report.pool.toString()
                  << ", allocated " << report.totalAllocated.toString()
                  << ", remaining " << report.remainingPool.toString()
                  << ", funded " << report.countWithStatus(domain::AllocationStatus::FUNDED)
                  << ", partial " << report.countWithStatus(domain::AllocationStatus::PARTIALLY_FUNDED)
                  << ", failed " << report.countWithStatus(domain::AllocationStatus::FAILED)
                  << ", reversed " << report.reversedAllocations << std::endl;
        return report;
    }

    domain::Allocation allocateManually(
        const std::string& ownerId, const domain::ManualAllocationRequest& request) override {
        if (!request.amount.isPositive()) {
            throw domain::InvalidAmount("Allocation amount must be positive");
        }

        auto lock = locks_->lockExclusive(ownerId);

        domain::TransferRequest transfer;
        transfer.sourceAccountId = request.sourceAccountId;
        transfer.destinationAccountId = request.destinationAccountId;
        transfer.periodId = request.periodId;
        transfer.amount = request.amount;
        transfer.kind = domain::TransactionKind::TRANSFER;
        transfer.description = request.notes.empty() ? "Manual allocation" : request.notes;

        domain::Allocation allocation(
            utils::UuidGenerator::generate(), ownerId, std::nullopt,
            request.sourceAccountId, request.destinationAccountId, request.periodId, request.amount);
        allocation.processed = true;
        allocation.notes = request.notes;

        posting_->transfer(ownerId, transfer, [&](const std::vector<domain::Transaction>& legs) {
            allocation.debitTransactionId = legs[0].id;
            allocation.creditTransactionId = legs[1].id;
            allocationRepository_->save(allocation);
        });

        std::cout << "[AllocationService] Manual allocation " << allocation.amount.toString()
                  << " " << allocation.sourceAccountId << " -> " << allocation.destinationAccountId << std::endl;
        return allocation;
    }

    std::vector<domain::Allocation> listAllocations(
        const std::string& ownerId, const std::string& periodId) override {
        auto lock = locks_->lockShared(ownerId);
        return allocationRepository_->findByPeriod(ownerId, periodId);
    }

private:
    std::shared_ptr<LedgerPosting> posting_;
    std::shared_ptr<ports::output::ITemplateRepository> templateRepository_;
    std::shared_ptr<ports::output::IAllocationRepository> allocationRepository_;
    std::shared_ptr<OwnerLockRegistry> locks_;

    /**
     * @brief Рассчитать и провести распределение одного шаблона
     *
     * Ошибки проводки не пробрасываются, а попадают в итог со статусом FAILED.
     */
    domain::TemplateOutcome allocateTemplate(
        const std::string& ownerId,
        const std::string& periodId,
        const std::string& sourceAccountId,
        const domain::BudgetTemplate& budgetTemplate,
        const domain::Money& pool,
        const domain::Money& remaining
    ) {
        domain::TemplateOutcome outcome;
        outcome.templateId = budgetTemplate.id;
        outcome.destinationAccountId = budgetTemplate.destinationAccountId;

        bool partial = false;
        if (remaining.isZero()) {
            outcome.status = domain::AllocationStatus::SKIPPED_POOL_EXHAUSTED;
            return outcome;
        }

        if (auto fixed = std::get_if<domain::FixedRule>(&budgetTemplate.rule)) {
            outcome.nominal = fixed->amount;
            outcome.allocated = domain::min(fixed->amount, remaining);
            partial = outcome.allocated < fixed->amount;
        } else if (auto percent = std::get_if<domain::PercentageRule>(&budgetTemplate.rule)) {
            // База процента - исходный пул, а не текущий остаток
            outcome.nominal = pool.percent(percent->percentage).roundedToCents();
            outcome.allocated = domain::min(outcome.nominal, remaining);
            partial = outcome.allocated < outcome.nominal;
        } else if (auto range = std::get_if<domain::RangeRule>(&budgetTemplate.rule)) {
            outcome.nominal = range->max;
            if (remaining < domain::max(range->min, domain::Money::zero())) {
                outcome.status = domain::AllocationStatus::SKIPPED_BELOW_FLOOR;
                return outcome;
            }
            outcome.allocated = domain::min(range->max, remaining);
        }

        if (!outcome.allocated.isPositive()) {
            outcome.allocated = domain::Money::zero();
            outcome.status = domain::AllocationStatus::SKIPPED_NOTHING_DUE;
            return outcome;
        }

        try {
            domain::TransferRequest transfer;
            transfer.sourceAccountId = sourceAccountId;
            transfer.destinationAccountId = budgetTemplate.destinationAccountId;
            transfer.periodId = periodId;
            transfer.amount = outcome.allocated;
            transfer.kind = domain::TransactionKind::TRANSFER;
            transfer.description = "Allocation " + domain::ruleTypeName(budgetTemplate.rule)
                + (budgetTemplate.notes.empty() ? "" : ": " + budgetTemplate.notes);

            domain::Allocation allocation(
                utils::UuidGenerator::generate(), ownerId, budgetTemplate.id,
                sourceAccountId, budgetTemplate.destinationAccountId, periodId, outcome.allocated);
            allocation.processed = true;
            allocation.partiallyFunded = partial;
            allocation.notes = budgetTemplate.notes;

            posting_->transfer(ownerId, transfer, [&](const std::vector<domain::Transaction>& legs) {
                allocation.debitTransactionId = legs[0].id;
                allocation.creditTransactionId = legs[1].id;
                allocationRepository_->save(allocation);
            });

            outcome.allocationId = allocation.id;
            outcome.status = partial
                ? domain::AllocationStatus::PARTIALLY_FUNDED
                : domain::AllocationStatus::FUNDED;
        } catch (const domain::LedgerException& e) {
            std::cerr << "[AllocationService] Template " << budgetTemplate.id
                      << " failed: " << e.what() << std::endl;
            outcome.allocated = domain::Money::zero();
            outcome.status = domain::AllocationStatus::FAILED;
            outcome.error = e.what();
        }
        return outcome;
    }

    void reverseAllocation(const std::string& ownerId, const std::string& periodId, domain::Allocation allocation) {
        allocation.reversed = true;
        try {
            posting_->reverse(ownerId, allocation.debitTransactionId, periodId,
                              "Reprocess: reversal of allocation " + allocation.id,
                              [&](const std::vector<domain::Transaction>&) {
                                  allocationRepository_->save(allocation);
                              });
        } catch (const domain::InvalidState& e) {
            // Перевод уже сторнирован вручную, остаётся только пометить распределение
            std::cerr << "[AllocationService] Allocation " << allocation.id
                      << " was already reversed: " << e.what() << std::endl;
            allocationRepository_->save(allocation);
        }
    }

    static domain::TemplateOutcome alreadyProcessed(const domain::Allocation& allocation) {
        domain::TemplateOutcome outcome;
        outcome.templateId = *allocation.templateId;
        outcome.destinationAccountId = allocation.destinationAccountId;
        outcome.status = domain::AllocationStatus::SKIPPED_ALREADY_PROCESSED;
        outcome.nominal = allocation.amount;
        outcome.allocated = allocation.amount;
        outcome.allocationId = allocation.id;
        return outcome;
    }
};

} // namespace budget::application
