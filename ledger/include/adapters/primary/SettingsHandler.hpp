#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpSupport.hpp"
#include "adapters/primary/JsonMapping.hpp"
#include "ports/input/IOwnerSettingsService.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace budget::adapters::primary {

/**
 * @brief HTTP Handler настроек владельца
 *
 * Endpoints:
 * - GET /api/v1/settings
 * - PUT /api/v1/settings   (меняются только переданные поля)
 */
class SettingsHandler : public IHttpHandler
{
public:
    explicit SettingsHandler(std::shared_ptr<ports::input::IOwnerSettingsService> settingsService)
        : settingsService_(std::move(settingsService))
    {
        std::cout << "[SettingsHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        http::guarded("SettingsHandler", req, res, [&](const std::string& ownerId) {
            std::string method = req.getMethod();

            if (method == "GET") {
                http::sendJson(res, 200, mapping::toJson(settingsService_->getSettings(ownerId)));
            } else if (method == "PUT") {
                handleUpdate(req, res, ownerId);
            } else {
                http::notFound(res);
            }
        });
    }

private:
    std::shared_ptr<ports::input::IOwnerSettingsService> settingsService_;

    void handleUpdate(IRequest& req, IResponse& res, const std::string& ownerId)
    {
        auto body = nlohmann::json::parse(req.getBody());
        auto settings = settingsService_->getSettings(ownerId);
        settings.ownerId = ownerId;

        if (body.contains("week_start_day")) {
            settings.weekStartDay = body.at("week_start_day").get<int>();
        }
        if (body.contains("default_interest_rate")) {
            settings.defaultInterestRate = mapping::rate(body.at("default_interest_rate"));
        }
        if (body.contains("interest_bookkeeping")) {
            settings.interestBookkeeping =
                domain::interestBookkeepingFromString(body.at("interest_bookkeeping").get<std::string>());
        }
        if (body.contains("auto_allocate")) {
            settings.autoAllocate = body.at("auto_allocate").get<bool>();
        }
        if (body.contains("auto_repay")) {
            settings.autoRepay = body.at("auto_repay").get<bool>();
        }
        if (body.contains("auto_repay_share")) {
            settings.autoRepayShare = mapping::rate(body.at("auto_repay_share"));
        }
        if (body.contains("auto_repay_threshold")) {
            settings.autoRepayThreshold = mapping::money(body.at("auto_repay_threshold"));
        }
        if (body.contains("utc_offset_minutes")) {
            settings.utcOffsetMinutes = body.at("utc_offset_minutes").get<int>();
        }

        http::sendJson(res, 200, mapping::toJson(settingsService_->updateSettings(settings)));
    }
};

} // namespace budget::adapters::primary
