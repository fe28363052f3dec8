#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpSupport.hpp"
#include "adapters/primary/JsonMapping.hpp"
#include "ports/input/ITemplateService.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace budget::adapters::primary {

/**
 * @brief HTTP Handler шаблонов бюджета
 *
 * Endpoints:
 * - POST   /api/v1/templates
 * - GET    /api/v1/templates?active_only=true
 * - GET    /api/v1/templates/{id}
 * - PUT    /api/v1/templates/{id}
 * - DELETE /api/v1/templates/{id}
 *
 * Правило передаётся объектом "rule": {"type": "FIXED", "amount": "100.00"},
 * {"type": "PERCENTAGE", "percentage": "30"}, {"type": "RANGE", "min": "20", "max": "50"}.
 */
class TemplateHandler : public IHttpHandler
{
public:
    explicit TemplateHandler(std::shared_ptr<ports::input::ITemplateService> templateService)
        : templateService_(std::move(templateService))
    {
        std::cout << "[TemplateHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        http::guarded("TemplateHandler", req, res, [&](const std::string& ownerId) {
            std::string method = req.getMethod();
            auto segments = http::segmentsAfter(req.getPath(), "/api/v1/templates");

            if (segments.empty() && method == "POST") {
                handleCreate(req, res, ownerId);
            } else if (segments.empty() && method == "GET") {
                bool activeOnly = req.getQueryParam("active_only").value_or("false") == "true";
                http::sendJson(res, 200, mapping::toJsonArray(templateService_->listTemplates(ownerId, activeOnly)));
            } else if (segments.size() == 1 && method == "GET") {
                auto found = templateService_->getTemplate(ownerId, segments[0]);
                if (!found) {
                    throw domain::UnknownTemplate(segments[0]);
                }
                http::sendJson(res, 200, mapping::toJson(*found));
            } else if (segments.size() == 1 && method == "PUT") {
                handleUpdate(req, res, ownerId, segments[0]);
            } else if (segments.size() == 1 && method == "DELETE") {
                templateService_->deleteTemplate(ownerId, segments[0]);
                nlohmann::json j;
                j["message"] = "Template deleted";
                j["template_id"] = segments[0];
                http::sendJson(res, 200, j);
            } else {
                http::notFound(res);
            }
        });
    }

private:
    std::shared_ptr<ports::input::ITemplateService> templateService_;

    void handleCreate(IRequest& req, IResponse& res, const std::string& ownerId)
    {
        auto body = nlohmann::json::parse(req.getBody());

        domain::TemplateRequest request;
        request.destinationAccountId = body.value("destination_account_id", "");
        request.rule = mapping::rule(body.at("rule"));
        request.priority = body.value("priority", 0);
        request.active = body.value("active", true);
        request.notes = body.value("notes", "");

        http::sendJson(res, 201, mapping::toJson(templateService_->createTemplate(ownerId, request)));
    }

    void handleUpdate(IRequest& req, IResponse& res, const std::string& ownerId, const std::string& templateId)
    {
        auto body = nlohmann::json::parse(req.getBody());

        domain::TemplateUpdate update;
        update.destinationAccountId = mapping::optionalString(body, "destination_account_id");
        if (body.contains("rule")) {
            update.rule = mapping::rule(body.at("rule"));
        }
        if (body.contains("priority")) {
            update.priority = body.at("priority").get<int>();
        }
        if (body.contains("active")) {
            update.active = body.at("active").get<bool>();
        }
        update.notes = mapping::optionalString(body, "notes");

        http::sendJson(res, 200, mapping::toJson(templateService_->updateTemplate(ownerId, templateId, update)));
    }
};

} // namespace budget::adapters::primary
