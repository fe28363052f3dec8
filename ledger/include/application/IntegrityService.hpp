#pragma once

#include "ports/input/IIntegrityService.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "application/LedgerPosting.hpp"
#include "domain/AccountHierarchy.hpp"
#include <OwnerLockRegistry.hpp>
#include <algorithm>
#include <deque>
#include <iostream>
#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>

namespace budget::application {

/**
 * @brief Проверка структурной целостности счетов владельца
 *
 * Проверки идут в фиксированном порядке: счета без владельца, корневые
 * счета с родителем, оборванные ссылки на родителя, циклы, категории,
 * расхождение кэша балансов с журналом. В режиме fix каждая проверка
 * видит исправления предыдущих.
 */
class IntegrityService : public ports::input::IIntegrityService {
public:
    IntegrityService(
        std::shared_ptr<ports::output::IAccountRepository> accountRepository,
        std::shared_ptr<LedgerPosting> posting,
        std::shared_ptr<OwnerLockRegistry> locks
    ) : accountRepository_(std::move(accountRepository))
      , posting_(std::move(posting))
      , locks_(std::move(locks))
    {
        std::cout << "[IntegrityService] Created" << std::endl;
    }

    domain::IntegrityReport validateIntegrity(const std::string& ownerId, bool fix) override {
        std::unique_lock<std::shared_mutex> exclusive;
        std::shared_lock<std::shared_mutex> shared;
        if (fix) {
            exclusive = locks_->lockExclusive(ownerId);
        } else {
            shared = locks_->lockShared(ownerId);
        }

        domain::IntegrityReport report;
        report.ownerId = ownerId;
        report.fixMode = fix;

        checkMissingOwner(report, fix);

        auto index = domain::AccountHierarchy::index(accountRepository_->findByOwner(ownerId));
        report.accountsChecked = index.size();

        checkRootsWithParent(report, index, fix);
        checkDanglingParents(report, index, fix);
        checkCycles(report, index, fix);
        checkCategories(report, index, fix);
        checkBalances(report, index, fix);

        std::cout << "[IntegrityService] Owner " << ownerId << ": " << report.accountsChecked
                  << " account(s) checked, " << report.issues.size() << " issue(s)"
                  << (fix ? ", fix mode" : "") << std::endl;
        return report;
    }

private:
    std::shared_ptr<ports::output::IAccountRepository> accountRepository_;
    std::shared_ptr<LedgerPosting> posting_;
    std::shared_ptr<OwnerLockRegistry> locks_;

    static domain::IntegrityIssue issue(domain::IntegrityIssueKind kind,
                                        const domain::Account& account,
                                        const std::string& detail) {
        domain::IntegrityIssue result;
        result.kind = kind;
        result.accountId = account.id;
        result.accountName = account.name;
        result.ownerId = account.ownerId;
        result.detail = detail;
        return result;
    }

    void detach(domain::AccountHierarchy::Index& index, const std::string& id) {
        auto& account = index.at(id);
        account.parentId.reset();
        accountRepository_->save(account);
    }

    void checkMissingOwner(domain::IntegrityReport& report, bool fix) {
        for (const auto& account : accountRepository_->findWithoutOwner()) {
            auto found = issue(domain::IntegrityIssueKind::MISSING_OWNER, account, "Account has no owner");
            if (fix) {
                found.fixed = accountRepository_->deleteById(account.id);
            }
            report.issues.push_back(found);
        }
    }

    void checkRootsWithParent(domain::IntegrityReport& report, domain::AccountHierarchy::Index& index, bool fix) {
        for (const auto& id : sortedIds(index)) {
            const auto& account = index.at(id);
            if (!account.isRoot || !account.parentId) {
                continue;
            }
            auto found = issue(domain::IntegrityIssueKind::ROOT_WITH_PARENT, account,
                               "Root account has parent " + *account.parentId);
            if (fix) {
                detach(index, id);
                found.fixed = true;
            }
            report.issues.push_back(found);
        }
    }

    void checkDanglingParents(domain::IntegrityReport& report, domain::AccountHierarchy::Index& index, bool fix) {
        for (const auto& id : sortedIds(index)) {
            const auto& account = index.at(id);
            if (!account.parentId || index.count(*account.parentId)) {
                continue;
            }
            auto found = issue(domain::IntegrityIssueKind::DANGLING_PARENT, account,
                               "Parent " + *account.parentId + " does not exist or belongs to another owner");
            if (fix) {
                detach(index, id);
                found.fixed = true;
            }
            report.issues.push_back(found);
        }
    }

    void checkCycles(domain::IntegrityReport& report, domain::AccountHierarchy::Index& index, bool fix) {
        for (const auto& cycle : domain::AccountHierarchy::findCycles(index)) {
            // Последний член цикла ссылается на первый
            const std::string& closing = cycle.back();

            std::string members;
            for (const auto& id : cycle) {
                members += (members.empty() ? "" : " -> ") + index.at(id).name;
            }
            auto found = issue(domain::IntegrityIssueKind::CYCLE, index.at(closing),
                               "Cycle: " + members + " -> " + index.at(cycle.front()).name);
            if (fix) {
                detach(index, closing);
                found.fixed = true;
            }
            report.issues.push_back(found);
        }
    }

    void checkCategories(domain::IntegrityReport& report, domain::AccountHierarchy::Index& index, bool fix) {
        std::deque<std::string> queue;
        for (const auto& id : sortedIds(index)) {
            if (!index.at(id).parentId) {
                queue.push_back(id);
            }
        }

        std::unordered_map<std::string, std::vector<std::string>> children;
        for (const auto& id : sortedIds(index)) {
            const auto& account = index.at(id);
            if (account.parentId) {
                children[*account.parentId].push_back(id);
            }
        }

        std::unordered_set<std::string> visited;
        while (!queue.empty()) {
            auto parentId = queue.front();
            queue.pop_front();
            if (!visited.insert(parentId).second) {
                continue;
            }

            const auto& parent = index.at(parentId);
            for (const auto& childId : children[parentId]) {
                auto& child = index.at(childId);
                if (child.category != parent.category) {
                    auto found = issue(domain::IntegrityIssueKind::CATEGORY_MISMATCH, child,
                                       "Category " + domain::toString(child.category) +
                                       " differs from parent category " + domain::toString(parent.category));
                    if (fix) {
                        child.category = parent.category;
                        accountRepository_->save(child);
                        found.fixed = true;
                    }
                    report.issues.push_back(found);
                }
                queue.push_back(childId);
            }
        }
    }

    void checkBalances(domain::IntegrityReport& report, domain::AccountHierarchy::Index& index, bool fix) {
        for (const auto& id : sortedIds(index)) {
            auto& account = index.at(id);
            auto folded = posting_->fold(account.id);
            if (folded == account.currentBalance) {
                continue;
            }
            auto found = issue(domain::IntegrityIssueKind::BALANCE_DRIFT, account,
                               "Cached balance " + account.currentBalance.toString() +
                               " differs from ledger " + folded.toString());
            if (fix) {
                found.fixed = accountRepository_->setCachedBalance(account.id, folded);
                account.currentBalance = folded;
            }
            report.issues.push_back(found);
        }
    }

    static std::vector<std::string> sortedIds(const domain::AccountHierarchy::Index& index) {
        std::vector<std::string> ids;
        ids.reserve(index.size());
        for (const auto& entry : index) {
            ids.push_back(entry.first);
        }
        std::sort(ids.begin(), ids.end());
        return ids;
    }
};

} // namespace budget::application
