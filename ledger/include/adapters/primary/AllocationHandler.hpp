#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpSupport.hpp"
#include "adapters/primary/JsonMapping.hpp"
#include "ports/input/IAllocationService.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace budget::adapters::primary {

/**
 * @brief HTTP Handler распределений
 *
 * Endpoints:
 * - POST /api/v1/allocations/run
 * - POST /api/v1/allocations
 * - GET  /api/v1/allocations?period={periodId}
 */
class AllocationHandler : public IHttpHandler
{
public:
    explicit AllocationHandler(std::shared_ptr<ports::input::IAllocationService> allocationService)
        : allocationService_(std::move(allocationService))
    {
        std::cout << "[AllocationHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        http::guarded("AllocationHandler", req, res, [&](const std::string& ownerId) {
            std::string method = req.getMethod();
            auto segments = http::segmentsAfter(req.getPath(), "/api/v1/allocations");

            if (method == "POST" && segments.size() == 1 && segments[0] == "run") {
                handleRun(req, res, ownerId);
            } else if (method == "POST" && segments.empty()) {
                handleManual(req, res, ownerId);
            } else if (method == "GET" && segments.empty()) {
                auto period = req.getQueryParam("period");
                if (!period || period->empty()) {
                    throw domain::InvalidArgument("Query parameter 'period' is required");
                }
                http::sendJson(res, 200, mapping::toJsonArray(allocationService_->listAllocations(ownerId, *period)));
            } else {
                http::notFound(res);
            }
        });
    }

private:
    std::shared_ptr<ports::input::IAllocationService> allocationService_;

    void handleRun(IRequest& req, IResponse& res, const std::string& ownerId)
    {
        auto body = nlohmann::json::parse(req.getBody());

        domain::AllocationRunRequest request;
        request.periodId = body.value("period_id", "");
        request.sourceAccountId = body.value("source_account_id", "");
        request.pool = mapping::requiredMoney(body, "pool");
        request.reprocess = body.value("reprocess", false);

        http::sendJson(res, 200, mapping::toJson(allocationService_->runAllocation(ownerId, request)));
    }

    void handleManual(IRequest& req, IResponse& res, const std::string& ownerId)
    {
        auto body = nlohmann::json::parse(req.getBody());

        domain::ManualAllocationRequest request;
        request.sourceAccountId = body.value("source_account_id", "");
        request.destinationAccountId = body.value("destination_account_id", "");
        request.periodId = body.value("period_id", "");
        request.amount = mapping::requiredMoney(body, "amount");
        request.notes = body.value("notes", "");

        http::sendJson(res, 201, mapping::toJson(allocationService_->allocateManually(ownerId, request)));
    }
};

} // namespace budget::adapters::primary
