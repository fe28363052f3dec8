#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpSupport.hpp"
#include "adapters/primary/JsonMapping.hpp"
#include "ports/input/IPeriodService.hpp"
#include "ports/input/IOwnerSettingsService.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace budget::adapters::primary {

/**
 * @brief HTTP Handler недельных периодов
 *
 * Endpoints:
 * - POST /api/v1/periods/open              {"epoch": "YYYY-MM-DD"}
 * - GET  /api/v1/periods/current?date=YYYY-MM-DD   (без date - сегодня в поясе владельца)
 * - GET  /api/v1/periods?from=YYYY-MM-DD&to=YYYY-MM-DD
 * - GET  /api/v1/periods/{id}
 */
class PeriodHandler : public IHttpHandler
{
public:
    PeriodHandler(
        std::shared_ptr<ports::input::IPeriodService> periodService,
        std::shared_ptr<ports::input::IOwnerSettingsService> settingsService
    ) : periodService_(std::move(periodService))
      , settingsService_(std::move(settingsService))
    {
        std::cout << "[PeriodHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        http::guarded("PeriodHandler", req, res, [&](const std::string& ownerId) {
            std::string method = req.getMethod();
            auto segments = http::segmentsAfter(req.getPath(), "/api/v1/periods");

            if (method == "POST" && segments.size() == 1 && segments[0] == "open") {
                auto body = nlohmann::json::parse(req.getBody());
                auto epoch = domain::Date::fromString(body.at("epoch").get<std::string>());
                http::sendJson(res, 201, mapping::toJson(periodService_->openLedger(ownerId, epoch)));
            } else if (method == "GET" && segments.size() == 1 && segments[0] == "current") {
                auto date = req.getQueryParam("date");
                auto today = date ? domain::Date::fromString(*date) : settingsService_->today(ownerId);
                http::sendJson(res, 200, mapping::toJson(periodService_->currentPeriod(ownerId, today)));
            } else if (method == "GET" && segments.empty()) {
                handleList(req, res, ownerId);
            } else if (method == "GET" && segments.size() == 1) {
                auto period = periodService_->getPeriod(ownerId, segments[0]);
                if (!period) {
                    throw domain::UnknownPeriod(segments[0]);
                }
                http::sendJson(res, 200, mapping::toJson(*period));
            } else {
                http::notFound(res);
            }
        });
    }

private:
    std::shared_ptr<ports::input::IPeriodService> periodService_;
    std::shared_ptr<ports::input::IOwnerSettingsService> settingsService_;

    void handleList(IRequest& req, IResponse& res, const std::string& ownerId)
    {
        auto from = req.getQueryParam("from");
        auto to = req.getQueryParam("to");
        if (!from && !to) {
            http::sendJson(res, 200, mapping::toJsonArray(periodService_->listPeriods(ownerId)));
            return;
        }
        if (!from || !to) {
            throw domain::InvalidArgument("Both 'from' and 'to' are required for a range");
        }

        nlohmann::json items = nlohmann::json::array();
        auto periods = periodService_->periodsInRange(
            ownerId, domain::Date::fromString(*from), domain::Date::fromString(*to));
        for (const auto& period : periods) {
            items.push_back(mapping::toJson(period));
        }
        http::sendJson(res, 200, items);
    }
};

} // namespace budget::adapters::primary
