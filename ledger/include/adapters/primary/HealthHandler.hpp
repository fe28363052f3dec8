#pragma once

#include <IHttpHandler.hpp>
#include "ports/output/ILedgerSettings.hpp"
#include "domain/Timestamp.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace budget::adapters::primary {

/**
 * @brief HTTP Handler для проверки здоровья сервера
 *
 * Endpoint: GET /api/v1/health
 */
class HealthHandler : public IHttpHandler
{
public:
    explicit HealthHandler(std::shared_ptr<ports::output::ILedgerSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[HealthHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        nlohmann::json response;
        response["status"] = "ok";
        response["service"] = "budget-ledger";
        response["timestamp"] = domain::Timestamp::now().toString();
        response["storage"] = settings_->getStorage();
        response["version"] = "1.0.0";

        res.setStatus(200);
        res.setHeader("Content-Type", "application/json");
        res.setBody(response.dump());
    }

private:
    std::shared_ptr<ports::output::ILedgerSettings> settings_;
};

} // namespace budget::adapters::primary
