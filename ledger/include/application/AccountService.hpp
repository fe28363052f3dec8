#pragma once

#include "ports/input/IAccountService.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "ports/output/ITransactionRepository.hpp"
#include "domain/AccountHierarchy.hpp"
#include "domain/LedgerError.hpp"
#include "utils/UuidGenerator.hpp"
#include <OwnerLockRegistry.hpp>
#include <algorithm>
#include <iostream>
#include <memory>

namespace budget::application {

/**
 * @brief Сервис дерева счетов
 *
 * Реализует IAccountService: создание, перенос, переименование,
 * (де)активация и удаление счетов с проверкой инвариантов дерева.
 * Каждое структурное изменение пишется в журнал изменений счёта.
 */
class AccountService : public ports::input::IAccountService {
public:
    AccountService(
        std::shared_ptr<ports::output::IAccountRepository> accountRepository,
        std::shared_ptr<ports::output::ITransactionRepository> transactionRepository,
        std::shared_ptr<OwnerLockRegistry> locks
    ) : accountRepository_(std::move(accountRepository))
      , transactionRepository_(std::move(transactionRepository))
      , locks_(std::move(locks))
    {
        std::cout << "[AccountService] Created" << std::endl;
    }

    domain::Account createAccount(
        const std::string& ownerId,
        const domain::AccountRequest& request
    ) override {
        auto lock = locks_->lockExclusive(ownerId);

        std::string name = trim(request.name);
        if (name.empty()) {
            throw domain::InvalidArgument("Account name is required");
        }
        if (request.targetAmount && request.targetAmount->isNegative()) {
            throw domain::InvalidAmount("Target amount must not be negative");
        }

        domain::Account account(
            utils::UuidGenerator::generate(), ownerId, name, request.category, request.parentId);
        account.targetAmount = request.targetAmount;
        account.sortOrder = request.sortOrder;
        account.description = request.description;
        account.isRoot = request.isRoot;

        auto index = loadIndex(ownerId);
        if (account.parentId) {
            auto parent = accountRepository_->findById(*account.parentId);
            if (!parent) {
                throw domain::UnknownAccount(*account.parentId);
            }
            domain::AccountHierarchy::validatePlacement(index, account, *parent);
        }
        domain::AccountHierarchy::validateSiblingName(index, account.parentId, account.name);

        accountRepository_->save(account);
        record(account, domain::AccountAction::CREATED, "", account.name);

        std::cout << "[AccountService] Created account '" << account.name << "' ("
                  << domain::toString(account.category) << ") for owner " << ownerId << std::endl;
        return account;
    }

    std::vector<domain::Account> setupDefaultAccounts(const std::string& ownerId) override {
        auto lock = locks_->lockExclusive(ownerId);

        struct Default { const char* name; domain::AccountCategory category; int sortOrder; };
        const Default defaults[] = {
            {"Income", domain::AccountCategory::INCOME, 0},
            {"Expenses", domain::AccountCategory::EXPENSE, 1},
        };

        auto existing = accountRepository_->findByOwner(ownerId);
        int created = 0;
        for (const auto& def : defaults) {
            bool present = std::any_of(existing.begin(), existing.end(), [&def](const domain::Account& a) {
                return a.isTopLevel() && a.name == def.name;
            });
            if (present) {
                continue;
            }

            domain::Account root(utils::UuidGenerator::generate(), ownerId, def.name, def.category);
            root.isRoot = true;
            root.sortOrder = def.sortOrder;
            root.description = std::string("Default ") + def.name + " account";
            accountRepository_->save(root);
            record(root, domain::AccountAction::CREATED, "", root.name);
            existing.push_back(root);
            ++created;
        }

        std::cout << "[AccountService] Default accounts for owner " << ownerId
                  << ": " << created << " created" << std::endl;

        std::vector<domain::Account> roots;
        for (const auto& account : existing) {
            if (account.isRoot) {
                roots.push_back(account);
            }
        }
        return roots;
    }

    domain::Account reparent(
        const std::string& ownerId,
        const std::string& accountId,
        const std::optional<std::string>& newParentId
    ) override {
        auto lock = locks_->lockExclusive(ownerId);

        auto index = loadIndex(ownerId);
        auto account = requireOwned(index, accountId);
        if (account.parentId == newParentId) {
            return account;
        }

        if (newParentId) {
            auto parent = accountRepository_->findById(*newParentId);
            if (!parent) {
                throw domain::UnknownAccount(*newParentId);
            }
            domain::AccountHierarchy::validatePlacement(index, account, *parent);
        }
        domain::AccountHierarchy::validateSiblingName(index, newParentId, account.name, account.id);

        std::string oldParent = account.parentId.value_or("");
        account.parentId = newParentId;
        accountRepository_->save(account);
        record(account, domain::AccountAction::MOVED, oldParent, newParentId.value_or(""));

        std::cout << "[AccountService] Moved account '" << account.name << "' under "
                  << (newParentId ? *newParentId : std::string("top level")) << std::endl;
        return account;
    }

    domain::Account rename(
        const std::string& ownerId,
        const std::string& accountId,
        const std::string& name
    ) override {
        auto lock = locks_->lockExclusive(ownerId);

        std::string newName = trim(name);
        if (newName.empty()) {
            throw domain::InvalidArgument("Account name is required");
        }

        auto index = loadIndex(ownerId);
        auto account = requireOwned(index, accountId);
        if (account.name == newName) {
            return account;
        }
        domain::AccountHierarchy::validateSiblingName(index, account.parentId, newName, account.id);

        std::string oldName = account.name;
        account.name = newName;
        accountRepository_->save(account);
        record(account, domain::AccountAction::RENAMED, oldName, newName);

        std::cout << "[AccountService] Renamed '" << oldName << "' to '" << newName << "'" << std::endl;
        return account;
    }

    domain::Account deactivate(const std::string& ownerId, const std::string& accountId) override {
        auto lock = locks_->lockExclusive(ownerId);

        auto index = loadIndex(ownerId);
        auto account = requireOwned(index, accountId);

        std::vector<std::string> subtree{account.id};
        auto below = domain::AccountHierarchy::descendants(index, account.id);
        subtree.insert(subtree.end(), below.begin(), below.end());

        int changed = setActive(index, subtree, false);
        std::cout << "[AccountService] Deactivated " << changed << " account(s) under '"
                  << account.name << "'" << std::endl;

        account.active = false;
        return account;
    }

    domain::Account activate(const std::string& ownerId, const std::string& accountId) override {
        auto lock = locks_->lockExclusive(ownerId);

        auto index = loadIndex(ownerId);
        auto account = requireOwned(index, accountId);
        if (account.parentId) {
            auto parent = index.find(*account.parentId);
            if (parent == index.end() || !parent->second.active) {
                throw domain::InvalidHierarchy("Cannot activate '" + account.name + "' under an inactive parent");
            }
        }

        setActive(index, {account.id}, true);
        std::cout << "[AccountService] Activated account '" << account.name << "'" << std::endl;

        account.active = true;
        return account;
    }

    domain::AccountRemoval removeAccount(const std::string& ownerId, const std::string& accountId) override {
        auto lock = locks_->lockExclusive(ownerId);

        auto index = loadIndex(ownerId);
        auto account = requireOwned(index, accountId);

        domain::AccountRemoval removal;
        removal.accountIds.push_back(account.id);
        auto below = domain::AccountHierarchy::descendants(index, account.id);
        removal.accountIds.insert(removal.accountIds.end(), below.begin(), below.end());

        bool hasHistory = std::any_of(removal.accountIds.begin(), removal.accountIds.end(),
            [this](const std::string& id) { return !transactionRepository_->findByAccount(id).empty(); });

        if (hasHistory) {
            setActive(index, removal.accountIds, false);
            removal.hardDeleted = false;
        } else {
            // Потомки раньше родителей
            for (auto it = removal.accountIds.rbegin(); it != removal.accountIds.rend(); ++it) {
                accountRepository_->deleteById(*it);
            }
            removal.hardDeleted = true;
        }

        std::cout << "[AccountService] Removed '" << account.name << "' with "
                  << removal.accountIds.size() << " account(s): "
                  << (removal.hardDeleted ? "deleted" : "deactivated, has history") << std::endl;
        return removal;
    }

    std::optional<domain::Account> getAccount(const std::string& ownerId, const std::string& accountId) override {
        auto lock = locks_->lockShared(ownerId);

        auto account = accountRepository_->findById(accountId);
        if (!account || account->ownerId != ownerId) {
            return std::nullopt;
        }
        return account;
    }

    std::vector<domain::Account> getAccounts(const std::string& ownerId) override {
        auto lock = locks_->lockShared(ownerId);

        auto accounts = accountRepository_->findByOwner(ownerId);
        std::sort(accounts.begin(), accounts.end(), [](const domain::Account& a, const domain::Account& b) {
            if (a.sortOrder != b.sortOrder) {
                return a.sortOrder < b.sortOrder;
            }
            return a.name < b.name;
        });
        return accounts;
    }

    domain::AccountTree getTree(const std::string& ownerId, bool includeInactive) override {
        auto lock = locks_->lockShared(ownerId);
        return domain::AccountHierarchy::buildTree(
            ownerId, accountRepository_->findByOwner(ownerId), includeInactive);
    }

    std::string getFullPath(const std::string& ownerId, const std::string& accountId) override {
        auto lock = locks_->lockShared(ownerId);

        auto index = loadIndex(ownerId);
        requireOwned(index, accountId);
        return domain::AccountHierarchy::fullPath(index, accountId);
    }

    std::vector<domain::AccountEvent> getAccountHistory(
        const std::string& ownerId, const std::string& accountId) override {
        auto lock = locks_->lockShared(ownerId);

        auto account = accountRepository_->findById(accountId);
        if (!account || account->ownerId != ownerId) {
            throw domain::UnknownAccount(accountId);
        }
        return accountRepository_->findEvents(accountId);
    }

private:
    std::shared_ptr<ports::output::IAccountRepository> accountRepository_;
    std::shared_ptr<ports::output::ITransactionRepository> transactionRepository_;
    std::shared_ptr<OwnerLockRegistry> locks_;

    domain::AccountHierarchy::Index loadIndex(const std::string& ownerId) {
        return domain::AccountHierarchy::index(accountRepository_->findByOwner(ownerId));
    }

    static domain::Account requireOwned(const domain::AccountHierarchy::Index& index, const std::string& accountId) {
        auto it = index.find(accountId);
        if (it == index.end()) {
            throw domain::UnknownAccount(accountId);
        }
        return it->second;
    }

    int setActive(const domain::AccountHierarchy::Index& index, const std::vector<std::string>& ids, bool active) {
        int changed = 0;
        for (const auto& id : ids) {
            auto it = index.find(id);
            if (it == index.end() || it->second.active == active) {
                continue;
            }
            domain::Account updated = it->second;
            updated.active = active;
            accountRepository_->save(updated);
            record(updated, active ? domain::AccountAction::ACTIVATED : domain::AccountAction::DEACTIVATED,
                   active ? "inactive" : "active", active ? "active" : "inactive");
            ++changed;
        }
        return changed;
    }

    void record(const domain::Account& account, domain::AccountAction action,
                const std::string& oldValue, const std::string& newValue) {
        accountRepository_->appendEvent(domain::AccountEvent(
            utils::UuidGenerator::generate(), account.id, account.ownerId, action, oldValue, newValue));
    }

    static std::string trim(const std::string& value) {
        auto begin = value.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos) {
            return "";
        }
        auto end = value.find_last_not_of(" \t\r\n");
        return value.substr(begin, end - begin + 1);
    }
};

} // namespace budget::application
