#pragma once

#include "domain/Account.hpp"
#include "domain/AccountEvent.hpp"
#include "domain/AccountTree.hpp"
#include "domain/Allocation.hpp"
#include "domain/AllocationRun.hpp"
#include "domain/BudgetTemplate.hpp"
#include "domain/IntegrityIssue.hpp"
#include "domain/Loan.hpp"
#include "domain/OwnerSettings.hpp"
#include "domain/Transaction.hpp"
#include "domain/WeeklyPeriod.hpp"
#include "domain/WeeklyRunReport.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace budget::adapters::primary::mapping {

using nlohmann::json;

// ============================================================================
// Чтение запросов
// ============================================================================

/**
 * @brief Сумма из JSON: строка "12.50" или число
 * @throws std::invalid_argument если значение не сумма
 */
inline domain::Money money(const json& value) {
    if (value.is_string()) {
        return domain::Money::fromString(value.get<std::string>());
    }
    if (value.is_number()) {
        return domain::Money::fromDouble(value.get<double>());
    }
    throw std::invalid_argument("Amount must be a decimal string or number");
}

inline domain::Rate rate(const json& value) {
    if (value.is_string()) {
        return domain::Rate::fromString(value.get<std::string>());
    }
    if (value.is_number()) {
        return domain::Rate::fromDouble(value.get<double>());
    }
    throw std::invalid_argument("Rate must be a decimal string or number");
}

inline domain::Money requiredMoney(const json& body, const char* field) {
    if (!body.contains(field)) {
        throw std::invalid_argument(std::string("Field '") + field + "' is required");
    }
    return money(body.at(field));
}

inline std::optional<std::string> optionalString(const json& body, const char* field) {
    if (!body.contains(field) || body.at(field).is_null()) {
        return std::nullopt;
    }
    return body.at(field).get<std::string>();
}

/**
 * @brief Правило шаблона: {"type": "FIXED", "amount": "100"} и т.п.
 */
inline domain::AllocationRule rule(const json& body) {
    std::string type = body.value("type", "");
    if (type == "FIXED") {
        return domain::FixedRule{requiredMoney(body, "amount")};
    }
    if (type == "PERCENTAGE") {
        if (!body.contains("percentage")) {
            throw std::invalid_argument("Field 'percentage' is required");
        }
        return domain::PercentageRule{rate(body.at("percentage"))};
    }
    if (type == "RANGE") {
        return domain::RangeRule{requiredMoney(body, "min"), requiredMoney(body, "max")};
    }
    throw std::invalid_argument("Unknown rule type: " + type);
}

// ============================================================================
// Ответы
// ============================================================================

inline json toJson(const domain::Account& account) {
    json j;
    j["id"] = account.id;
    j["owner_id"] = account.ownerId;
    j["name"] = account.name;
    j["category"] = domain::toString(account.category);
    j["parent_id"] = account.parentId ? json(*account.parentId) : json(nullptr);
    j["target_amount"] = account.targetAmount ? json(account.targetAmount->toString()) : json(nullptr);
    j["balance"] = account.currentBalance.toString();
    j["active"] = account.active;
    j["sort_order"] = account.sortOrder;
    j["is_root"] = account.isRoot;
    j["description"] = account.description;
    j["created_at"] = account.createdAt.toString();
    return j;
}

inline json toJson(const domain::AccountEvent& event) {
    json j;
    j["id"] = event.id;
    j["account_id"] = event.accountId;
    j["action"] = domain::toString(event.action);
    j["old_value"] = event.oldValue;
    j["new_value"] = event.newValue;
    j["timestamp"] = event.timestamp.toString();
    return j;
}

namespace detail {

inline json treeNode(const domain::AccountTree& tree, const std::string& id) {
    json node = toJson(tree.accounts.at(id));
    json children = json::array();
    for (const auto& childId : tree.childrenOf(id)) {
        children.push_back(treeNode(tree, childId));
    }
    node["children"] = children;
    return node;
}

} // namespace detail

/**
 * @brief Лес счетов вложенными узлами
 */
inline json toJson(const domain::AccountTree& tree) {
    json roots = json::array();
    for (const auto& id : tree.roots) {
        roots.push_back(detail::treeNode(tree, id));
    }
    json j;
    j["owner_id"] = tree.ownerId;
    j["accounts"] = roots;
    return j;
}

inline json toJson(const domain::WeeklyPeriod& period) {
    json j;
    j["id"] = period.id;
    j["start_date"] = period.startDate.toString();
    j["end_date"] = period.endDate.toString();
    j["created_at"] = period.createdAt.toString();
    return j;
}

inline json toJson(const domain::Transaction& transaction) {
    json j;
    j["id"] = transaction.id;
    j["account_id"] = transaction.accountId;
    j["period_id"] = transaction.periodId;
    j["period_start"] = transaction.periodStart.toString();
    j["amount"] = transaction.amount.toString();
    j["kind"] = domain::toString(transaction.kind);
    j["description"] = transaction.description;
    j["timestamp"] = transaction.timestamp.toString();
    j["sequence"] = transaction.sequence;
    j["transfer_id"] = transaction.transferId ? json(*transaction.transferId) : json(nullptr);
    j["reverses_id"] = transaction.reversesId ? json(*transaction.reversesId) : json(nullptr);
    return j;
}

inline json toJson(const domain::AllocationRule& rule) {
    json j;
    j["type"] = domain::ruleTypeName(rule);
    if (auto fixed = std::get_if<domain::FixedRule>(&rule)) {
        j["amount"] = fixed->amount.toString();
    } else if (auto percent = std::get_if<domain::PercentageRule>(&rule)) {
        j["percentage"] = percent->percentage.toString();
    } else if (auto range = std::get_if<domain::RangeRule>(&rule)) {
        j["min"] = range->min.toString();
        j["max"] = range->max.toString();
    }
    return j;
}

inline json toJson(const domain::BudgetTemplate& budgetTemplate) {
    json j;
    j["id"] = budgetTemplate.id;
    j["destination_account_id"] = budgetTemplate.destinationAccountId;
    j["rule"] = toJson(budgetTemplate.rule);
    j["priority"] = budgetTemplate.priority;
    j["active"] = budgetTemplate.active;
    j["notes"] = budgetTemplate.notes;
    j["created_at"] = budgetTemplate.createdAt.toString();
    return j;
}

inline json toJson(const domain::Allocation& allocation) {
    json j;
    j["id"] = allocation.id;
    j["template_id"] = allocation.templateId ? json(*allocation.templateId) : json(nullptr);
    j["source_account_id"] = allocation.sourceAccountId;
    j["destination_account_id"] = allocation.destinationAccountId;
    j["period_id"] = allocation.periodId;
    j["amount"] = allocation.amount.toString();
    j["processed"] = allocation.processed;
    j["partially_funded"] = allocation.partiallyFunded;
    j["reversed"] = allocation.reversed;
    j["notes"] = allocation.notes;
    j["created_at"] = allocation.createdAt.toString();
    return j;
}

inline json toJson(const domain::AllocationReport& report) {
    json outcomes = json::array();
    for (const auto& outcome : report.outcomes) {
        json o;
        o["template_id"] = outcome.templateId;
        o["destination_account_id"] = outcome.destinationAccountId;
        o["status"] = domain::toString(outcome.status);
        o["nominal"] = outcome.nominal.toString();
        o["allocated"] = outcome.allocated.toString();
        o["allocation_id"] = outcome.allocationId ? json(*outcome.allocationId) : json(nullptr);
        if (!outcome.error.empty()) {
            o["error"] = outcome.error;
        }
        outcomes.push_back(o);
    }

    json j;
    j["period_id"] = report.periodId;
    j["source_account_id"] = report.sourceAccountId;
    j["pool"] = report.pool.toString();
    j["total_allocated"] = report.totalAllocated.toString();
    j["remaining_pool"] = report.remainingPool.toString();
    j["reversed_allocations"] = report.reversedAllocations;
    j["outcomes"] = outcomes;
    return j;
}

inline json toJson(const domain::Loan& loan) {
    json j;
    j["id"] = loan.id;
    j["lender_account_id"] = loan.lenderAccountId;
    j["borrower_account_id"] = loan.borrowerAccountId;
    j["principal"] = loan.principal.toString();
    j["rate_per_period"] = loan.ratePerPeriod.toString();
    j["outstanding"] = loan.outstanding.toString();
    j["total_interest"] = loan.totalInterest.toString();
    j["status"] = domain::toString(loan.status);
    j["disbursement_period_id"] = loan.disbursementPeriodId;
    j["description"] = loan.description;
    j["accrued_periods"] = loan.accruedPeriods;
    j["created_at"] = loan.createdAt.toString();
    j["paid_at"] = loan.paidAt ? json(loan.paidAt->toString()) : json(nullptr);
    return j;
}

inline json toJson(const domain::LoanPayment& payment) {
    json j;
    j["id"] = payment.id;
    j["loan_id"] = payment.loanId;
    j["period_id"] = payment.periodId;
    j["amount"] = payment.amount.toString();
    j["outstanding_after"] = payment.outstandingAfter.toString();
    j["notes"] = payment.notes;
    j["timestamp"] = payment.timestamp.toString();
    return j;
}

inline json toJson(const domain::AccrualSummary& summary) {
    json loans = json::array();
    for (const auto& loan : summary.accrued) {
        loans.push_back(toJson(loan));
    }
    json j;
    j["accrued"] = loans;
    j["total_interest"] = summary.totalInterest.toString();
    j["errors"] = summary.errors;
    return j;
}

inline json toJson(const domain::IntegrityReport& report) {
    json issues = json::array();
    for (const auto& issue : report.issues) {
        json i;
        i["kind"] = domain::toString(issue.kind);
        i["account_id"] = issue.accountId;
        i["account_name"] = issue.accountName;
        i["detail"] = issue.detail;
        i["fixed"] = issue.fixed;
        issues.push_back(i);
    }
    json j;
    j["owner_id"] = report.ownerId;
    j["fix_mode"] = report.fixMode;
    j["accounts_checked"] = report.accountsChecked;
    j["clean"] = report.isClean();
    j["issues"] = issues;
    return j;
}

inline json toJson(const domain::WeeklyRunReport& report) {
    json j;
    j["owner_id"] = report.ownerId;
    j["date"] = report.date.toString();
    j["period_id"] = report.periodId;
    j["allocation"] = report.allocation ? toJson(*report.allocation) : json(nullptr);
    if (!report.allocationSkippedReason.empty()) {
        j["allocation_skipped_reason"] = report.allocationSkippedReason;
    }
    j["loans_accrued"] = report.loansAccrued;
    j["interest_accrued"] = report.interestAccrued.toString();
    j["repayments_made"] = report.repaymentsMade;
    j["total_repaid"] = report.totalRepaid.toString();
    j["errors"] = report.errors;
    return j;
}

inline json toJson(const domain::OwnerSettings& settings) {
    json j;
    j["owner_id"] = settings.ownerId;
    j["week_start_day"] = settings.weekStartDay;
    j["default_interest_rate"] = settings.defaultInterestRate.toString();
    j["interest_bookkeeping"] = domain::toString(settings.interestBookkeeping);
    j["auto_allocate"] = settings.autoAllocate;
    j["auto_repay"] = settings.autoRepay;
    j["auto_repay_share"] = settings.autoRepayShare.toString();
    j["auto_repay_threshold"] = settings.autoRepayThreshold.toString();
    j["utc_offset_minutes"] = settings.utcOffsetMinutes;
    j["epoch"] = settings.epoch ? json(settings.epoch->toString()) : json(nullptr);
    return j;
}

template <typename T>
json toJsonArray(const std::vector<T>& items) {
    json array = json::array();
    for (const auto& item : items) {
        array.push_back(toJson(item));
    }
    return array;
}

} // namespace budget::adapters::primary::mapping
