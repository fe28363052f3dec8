#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpSupport.hpp"
#include "adapters/primary/JsonMapping.hpp"
#include "ports/input/IIntegrityService.hpp"
#include <iostream>
#include <memory>

namespace budget::adapters::primary {

/**
 * @brief HTTP Handler проверки целостности
 *
 * Endpoint: GET /api/v1/integrity?fix=true
 */
class IntegrityHandler : public IHttpHandler
{
public:
    explicit IntegrityHandler(std::shared_ptr<ports::input::IIntegrityService> integrityService)
        : integrityService_(std::move(integrityService))
    {
        std::cout << "[IntegrityHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        http::guarded("IntegrityHandler", req, res, [&](const std::string& ownerId) {
            bool fix = req.getQueryParam("fix").value_or("false") == "true";
            http::sendJson(res, 200, mapping::toJson(integrityService_->validateIntegrity(ownerId, fix)));
        });
    }

private:
    std::shared_ptr<ports::input::IIntegrityService> integrityService_;
};

} // namespace budget::adapters::primary
