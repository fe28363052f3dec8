#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpSupport.hpp"
#include "adapters/primary/JsonMapping.hpp"
#include "ports/input/IWeeklyBudgetProcessor.hpp"
#include "ports/input/IOwnerSettingsService.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace budget::adapters::primary {

/**
 * @brief HTTP Handler еженедельной обработки
 *
 * Endpoint: POST /api/v1/weekly-run
 * Тело (все поля необязательны): {"date": "YYYY-MM-DD", "source_account_id": "...", "force": false}
 * Без date обрабатывается сегодняшний день в поясе владельца.
 */
class WeeklyRunHandler : public IHttpHandler
{
public:
    WeeklyRunHandler(
        std::shared_ptr<ports::input::IWeeklyBudgetProcessor> processor,
        std::shared_ptr<ports::input::IOwnerSettingsService> settingsService
    ) : processor_(std::move(processor))
      , settingsService_(std::move(settingsService))
    {
        std::cout << "[WeeklyRunHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        http::guarded("WeeklyRunHandler", req, res, [&](const std::string& ownerId) {
            auto body = req.getBody().empty() ? nlohmann::json::object() : nlohmann::json::parse(req.getBody());

            auto date = body.contains("date")
                ? domain::Date::fromString(body.at("date").get<std::string>())
                : settingsService_->today(ownerId);

            ports::input::WeeklyRunOptions options;
            options.sourceAccountId = mapping::optionalString(body, "source_account_id");
            options.force = body.value("force", false);

            http::sendJson(res, 200, mapping::toJson(processor_->process(ownerId, date, options)));
        });
    }

private:
    std::shared_ptr<ports::input::IWeeklyBudgetProcessor> processor_;
    std::shared_ptr<ports::input::IOwnerSettingsService> settingsService_;
};

} // namespace budget::adapters::primary
