#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpSupport.hpp"
#include "adapters/primary/JsonMapping.hpp"
#include "ports/input/ILoanService.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace budget::adapters::primary {

/**
 * @brief HTTP Handler займов
 *
 * Endpoints:
 * - POST /api/v1/loans
 * - GET  /api/v1/loans?active_only=true
 * - GET  /api/v1/loans/{id}
 * - GET  /api/v1/loans/{id}/payments
 * - POST /api/v1/loans/{id}/repay
 * - POST /api/v1/loans/{id}/accrue
 * - POST /api/v1/loans/accrue
 */
class LoanHandler : public IHttpHandler
{
public:
    explicit LoanHandler(std::shared_ptr<ports::input::ILoanService> loanService)
        : loanService_(std::move(loanService))
    {
        std::cout << "[LoanHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        http::guarded("LoanHandler", req, res, [&](const std::string& ownerId) {
            std::string method = req.getMethod();
            auto segments = http::segmentsAfter(req.getPath(), "/api/v1/loans");

            if (method == "POST" && segments.empty()) {
                handleDisburse(req, res, ownerId);
            } else if (method == "GET" && segments.empty()) {
                bool activeOnly = req.getQueryParam("active_only").value_or("false") == "true";
                http::sendJson(res, 200, mapping::toJsonArray(loanService_->listLoans(ownerId, activeOnly)));
            } else if (method == "POST" && segments.size() == 1 && segments[0] == "accrue") {
                auto body = nlohmann::json::parse(req.getBody());
                auto summary = loanService_->accrueAll(ownerId, body.at("period_id").get<std::string>());
                http::sendJson(res, 200, mapping::toJson(summary));
            } else if (method == "GET" && segments.size() == 1) {
                auto loan = loanService_->getLoan(ownerId, segments[0]);
                if (!loan) {
                    throw domain::UnknownLoan(segments[0]);
                }
                http::sendJson(res, 200, mapping::toJson(*loan));
            } else if (segments.size() == 2) {
                dispatchAction(req, res, ownerId, segments[0], segments[1]);
            } else {
                http::notFound(res);
            }
        });
    }

private:
    std::shared_ptr<ports::input::ILoanService> loanService_;

    void dispatchAction(IRequest& req, IResponse& res, const std::string& ownerId,
                        const std::string& loanId, const std::string& action)
    {
        std::string method = req.getMethod();

        if (method == "GET" && action == "payments") {
            http::sendJson(res, 200, mapping::toJsonArray(loanService_->getPayments(ownerId, loanId)));
        } else if (method == "POST" && action == "repay") {
            auto body = nlohmann::json::parse(req.getBody());
            auto payment = loanService_->repay(
                ownerId, loanId,
                mapping::requiredMoney(body, "amount"),
                body.value("period_id", ""),
                body.value("notes", ""));
            http::sendJson(res, 201, mapping::toJson(payment));
        } else if (method == "POST" && action == "accrue") {
            auto body = nlohmann::json::parse(req.getBody());
            auto loan = loanService_->accrueInterest(ownerId, loanId, body.at("period_id").get<std::string>());
            http::sendJson(res, 200, mapping::toJson(loan));
        } else {
            http::notFound(res);
        }
    }

    void handleDisburse(IRequest& req, IResponse& res, const std::string& ownerId)
    {
        auto body = nlohmann::json::parse(req.getBody());

        domain::LoanRequest request;
        request.lenderAccountId = body.value("lender_account_id", "");
        request.borrowerAccountId = body.value("borrower_account_id", "");
        request.principal = mapping::requiredMoney(body, "principal");
        if (body.contains("rate_per_period") && !body["rate_per_period"].is_null()) {
            request.ratePerPeriod = mapping::rate(body["rate_per_period"]);
        }
        request.periodId = body.value("period_id", "");
        request.description = body.value("description", "");

        http::sendJson(res, 201, mapping::toJson(loanService_->disburse(ownerId, request)));
    }
};

} // namespace budget::adapters::primary
