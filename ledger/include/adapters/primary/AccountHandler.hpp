#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpSupport.hpp"
#include "adapters/primary/JsonMapping.hpp"
#include "ports/input/IAccountService.hpp"
#include "ports/input/ILedgerService.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <iostream>
#include <memory>

namespace budget::adapters::primary {

/**
 * @brief HTTP Handler дерева счетов
 *
 * Endpoints:
 * - POST   /api/v1/accounts
 * - POST   /api/v1/accounts/defaults
 * - GET    /api/v1/accounts?include_inactive=true
 * - GET    /api/v1/accounts/{id}
 * - PUT    /api/v1/accounts/{id}/parent
 * - PUT    /api/v1/accounts/{id}/name
 * - POST   /api/v1/accounts/{id}/deactivate
 * - POST   /api/v1/accounts/{id}/activate
 * - DELETE /api/v1/accounts/{id}
 * - GET    /api/v1/accounts/{id}/balance?as_of={periodId}
 * - GET    /api/v1/accounts/{id}/transactions?from=YYYY-MM-DD&to=YYYY-MM-DD
 * - GET    /api/v1/accounts/{id}/history
 */
class AccountHandler : public IHttpHandler
{
public:
    AccountHandler(
        std::shared_ptr<ports::input::IAccountService> accountService,
        std::shared_ptr<ports::input::ILedgerService> ledgerService
    ) : accountService_(std::move(accountService))
      , ledgerService_(std::move(ledgerService))
    {
        std::cout << "[AccountHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        http::guarded("AccountHandler", req, res, [&](const std::string& ownerId) {
            std::string method = req.getMethod();
            auto segments = http::segmentsAfter(req.getPath(), "/api/v1/accounts");

            if (segments.empty()) {
                if (method == "POST") {
                    handleCreate(req, res, ownerId);
                } else if (method == "GET") {
                    handleTree(req, res, ownerId);
                } else {
                    http::notFound(res);
                }
            } else if (segments.size() == 1 && segments[0] == "defaults" && method == "POST") {
                auto roots = accountService_->setupDefaultAccounts(ownerId);
                http::sendJson(res, 200, mapping::toJsonArray(roots));
            } else if (segments.size() == 1) {
                const std::string& accountId = segments[0];
                if (method == "GET") {
                    handleGet(res, ownerId, accountId);
                } else if (method == "DELETE") {
                    handleRemove(res, ownerId, accountId);
                } else {
                    http::notFound(res);
                }
            } else if (segments.size() == 2) {
                dispatchAction(req, res, ownerId, segments[0], segments[1]);
            } else {
                http::notFound(res);
            }
        });
    }

private:
    std::shared_ptr<ports::input::IAccountService> accountService_;
    std::shared_ptr<ports::input::ILedgerService> ledgerService_;

    void dispatchAction(IRequest& req, IResponse& res, const std::string& ownerId,
                        const std::string& accountId, const std::string& action)
    {
        std::string method = req.getMethod();

        if (method == "PUT" && action == "parent") {
            auto body = nlohmann::json::parse(req.getBody());
            auto account = accountService_->reparent(ownerId, accountId, mapping::optionalString(body, "parent_id"));
            http::sendJson(res, 200, mapping::toJson(account));
        } else if (method == "PUT" && action == "name") {
            auto body = nlohmann::json::parse(req.getBody());
            auto account = accountService_->rename(ownerId, accountId, body.value("name", ""));
            http::sendJson(res, 200, mapping::toJson(account));
        } else if (method == "POST" && action == "deactivate") {
            http::sendJson(res, 200, mapping::toJson(accountService_->deactivate(ownerId, accountId)));
        } else if (method == "POST" && action == "activate") {
            http::sendJson(res, 200, mapping::toJson(accountService_->activate(ownerId, accountId)));
        } else if (method == "GET" && action == "balance") {
            handleBalance(req, res, ownerId, accountId);
        } else if (method == "GET" && action == "transactions") {
            handleTransactions(req, res, ownerId, accountId);
        } else if (method == "GET" && action == "history") {
            auto events = accountService_->getAccountHistory(ownerId, accountId);
            http::sendJson(res, 200, mapping::toJsonArray(events));
        } else {
            http::notFound(res);
        }
    }

    void handleCreate(IRequest& req, IResponse& res, const std::string& ownerId)
    {
        auto body = nlohmann::json::parse(req.getBody());

        domain::AccountRequest request;
        request.name = body.value("name", "");
        request.category = domain::accountCategoryFromString(body.value("category", ""));
        request.parentId = mapping::optionalString(body, "parent_id");
        if (body.contains("target_amount") && !body["target_amount"].is_null()) {
            request.targetAmount = mapping::money(body["target_amount"]);
        }
        request.sortOrder = body.value("sort_order", 0);
        request.description = body.value("description", "");

        auto account = accountService_->createAccount(ownerId, request);
        http::sendJson(res, 201, mapping::toJson(account));
    }

    void handleTree(IRequest& req, IResponse& res, const std::string& ownerId)
    {
        bool includeInactive = req.getQueryParam("include_inactive").value_or("false") == "true";
        auto tree = accountService_->getTree(ownerId, includeInactive);
        http::sendJson(res, 200, mapping::toJson(tree));
    }

    void handleGet(IResponse& res, const std::string& ownerId, const std::string& accountId)
    {
        auto account = accountService_->getAccount(ownerId, accountId);
        if (!account) {
            throw domain::UnknownAccount(accountId);
        }

        auto j = mapping::toJson(*account);
        j["full_path"] = accountService_->getFullPath(ownerId, accountId);
        j["ledger_balance"] = ledgerService_->getBalance(ownerId, accountId).toString();
        j["balance_with_descendants"] = ledgerService_->getBalanceWithDescendants(ownerId, accountId).toString();
        http::sendJson(res, 200, j);
    }

    void handleRemove(IResponse& res, const std::string& ownerId, const std::string& accountId)
    {
        auto removal = accountService_->removeAccount(ownerId, accountId);

        nlohmann::json j;
        j["hard_deleted"] = removal.hardDeleted;
        j["account_ids"] = removal.accountIds;
        http::sendJson(res, 200, j);
    }

    void handleBalance(IRequest& req, IResponse& res, const std::string& ownerId, const std::string& accountId)
    {
        auto asOf = req.getQueryParam("as_of");
        if (asOf && asOf->empty()) {
            asOf.reset();
        }

        nlohmann::json j;
        j["account_id"] = accountId;
        j["as_of"] = asOf ? nlohmann::json(*asOf) : nlohmann::json(nullptr);
        j["balance"] = ledgerService_->getBalance(ownerId, accountId, asOf).toString();
        j["cached_balance"] = ledgerService_->getCachedBalance(ownerId, accountId).toString();
        http::sendJson(res, 200, j);
    }

    void handleTransactions(IRequest& req, IResponse& res, const std::string& ownerId, const std::string& accountId)
    {
        auto from = req.getQueryParam("from");
        auto to = req.getQueryParam("to");

        std::optional<domain::PeriodRange> range;
        if (from || to) {
            domain::PeriodRange r;
            r.from = from ? domain::Date::fromString(*from) : domain::Date(INT32_MIN);
            r.to = to ? domain::Date::fromString(*to) : domain::Date(INT32_MAX);
            range = r;
        }

        nlohmann::json items = nlohmann::json::array();
        for (const auto& transaction : ledgerService_->history(ownerId, accountId, range)) {
            items.push_back(mapping::toJson(transaction));
        }
        http::sendJson(res, 200, items);
    }
};

} // namespace budget::adapters::primary
