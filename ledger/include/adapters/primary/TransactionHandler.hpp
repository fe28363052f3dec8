#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpSupport.hpp"
#include "adapters/primary/JsonMapping.hpp"
#include "ports/input/ILedgerService.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace budget::adapters::primary {

/**
 * @brief HTTP Handler журнала проводок
 *
 * Endpoints:
 * - POST /api/v1/transactions
 * - GET  /api/v1/transactions/{id}
 * - POST /api/v1/transactions/{id}/reverse
 * - POST /api/v1/transfers
 * - POST /api/v1/balances/recompute
 */
class TransactionHandler : public IHttpHandler
{
public:
    explicit TransactionHandler(std::shared_ptr<ports::input::ILedgerService> ledgerService)
        : ledgerService_(std::move(ledgerService))
    {
        std::cout << "[TransactionHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        http::guarded("TransactionHandler", req, res, [&](const std::string& ownerId) {
            std::string method = req.getMethod();
            std::string path = req.getPath();

            if (method == "POST" && path.find("/api/v1/transfers") == 0) {
                handleTransfer(req, res, ownerId);
                return;
            }
            if (method == "POST" && path.find("/api/v1/balances/recompute") == 0) {
                nlohmann::json j;
                j["accounts_fixed"] = ledgerService_->recomputeBalances(ownerId);
                http::sendJson(res, 200, j);
                return;
            }

            auto segments = http::segmentsAfter(path, "/api/v1/transactions");
            if (method == "POST" && segments.empty()) {
                handlePost(req, res, ownerId);
            } else if (method == "GET" && segments.size() == 1) {
                auto transaction = ledgerService_->getTransaction(ownerId, segments[0]);
                if (!transaction) {
                    throw domain::UnknownTransaction(segments[0]);
                }
                http::sendJson(res, 200, mapping::toJson(*transaction));
            } else if (method == "POST" && segments.size() == 2 && segments[1] == "reverse") {
                handleReverse(req, res, ownerId, segments[0]);
            } else {
                http::notFound(res);
            }
        });
    }

private:
    std::shared_ptr<ports::input::ILedgerService> ledgerService_;

    void handlePost(IRequest& req, IResponse& res, const std::string& ownerId)
    {
        auto body = nlohmann::json::parse(req.getBody());

        domain::PostingRequest request;
        request.accountId = body.value("account_id", "");
        request.periodId = body.value("period_id", "");
        request.amount = mapping::requiredMoney(body, "amount");
        request.kind = domain::transactionKindFromString(body.value("kind", "INCOME"));
        request.description = body.value("description", "");

        http::sendJson(res, 201, mapping::toJson(ledgerService_->post(ownerId, request)));
    }

    void handleTransfer(IRequest& req, IResponse& res, const std::string& ownerId)
    {
        auto body = nlohmann::json::parse(req.getBody());

        domain::TransferRequest request;
        request.sourceAccountId = body.value("source_account_id", "");
        request.destinationAccountId = body.value("destination_account_id", "");
        request.periodId = body.value("period_id", "");
        request.amount = mapping::requiredMoney(body, "amount");
        request.kind = domain::transactionKindFromString(body.value("kind", "TRANSFER"));
        request.description = body.value("description", "");

        auto legs = ledgerService_->postTransfer(ownerId, request);

        nlohmann::json j;
        j["transfer_id"] = *legs.debit.transferId;
        j["debit"] = mapping::toJson(legs.debit);
        j["credit"] = mapping::toJson(legs.credit);
        http::sendJson(res, 201, j);
    }

    void handleReverse(IRequest& req, IResponse& res, const std::string& ownerId, const std::string& transactionId)
    {
        auto body = req.getBody().empty() ? nlohmann::json::object() : nlohmann::json::parse(req.getBody());

        std::string periodId = body.value("period_id", "");
        if (periodId.empty()) {
            auto original = ledgerService_->getTransaction(ownerId, transactionId);
            if (!original) {
                throw domain::UnknownTransaction(transactionId);
            }
            periodId = original->periodId;
        }

        auto reversals = ledgerService_->reverse(ownerId, transactionId, periodId, body.value("description", ""));
        http::sendJson(res, 201, mapping::toJsonArray(reversals));
    }
};

} // namespace budget::adapters::primary
