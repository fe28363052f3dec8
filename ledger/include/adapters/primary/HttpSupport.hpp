#pragma once

#include <IHttpHandler.hpp>
#include "domain/LedgerError.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace budget::adapters::primary {

/**
 * @brief Общие части HTTP-обработчиков ledger
 *
 * Владелец передаётся в заголовке X-Owner-Id. Ошибки отдаются
 * в виде {"error": ..., "kind": ...}.
 */
namespace http {

inline void sendJson(IResponse& res, int status, const nlohmann::json& body) {
    res.setStatus(status);
    res.setHeader("Content-Type", "application/json");
    res.setBody(body.dump());
}

inline void sendError(IResponse& res, int status, const std::string& message, const std::string& kind) {
    nlohmann::json body;
    body["error"] = message;
    body["kind"] = kind;
    sendJson(res, status, body);
}

/**
 * @brief HTTP статус для вида ошибки ledger
 */
inline int statusFor(domain::ErrorKind kind) {
    switch (kind) {
        case domain::ErrorKind::UNKNOWN_ACCOUNT:
        case domain::ErrorKind::UNKNOWN_PERIOD:
        case domain::ErrorKind::UNKNOWN_TEMPLATE:
        case domain::ErrorKind::UNKNOWN_LOAN:
        case domain::ErrorKind::UNKNOWN_TRANSACTION:
            return 404;
        case domain::ErrorKind::OVERPAYMENT:
        case domain::ErrorKind::PERIOD_GAP:
        case domain::ErrorKind::INVALID_STATE:
            return 409;
        case domain::ErrorKind::INVALID_HIERARCHY:
        case domain::ErrorKind::INVALID_AMOUNT:
        case domain::ErrorKind::SAME_ACCOUNT:
        case domain::ErrorKind::INVALID_POOL:
        case domain::ErrorKind::INVALID_ARGUMENT:
            return 422;
    }
    return 500;
}

/**
 * @brief Владелец из заголовка X-Owner-Id
 */
inline std::optional<std::string> ownerId(IRequest& req) {
    auto headers = req.getHeaders();
    auto it = headers.find("X-Owner-Id");
    if (it == headers.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

/**
 * @brief Сегменты пути после префикса: "/api/v1/loans/abc/repay" → {"abc", "repay"}
 */
inline std::vector<std::string> segmentsAfter(const std::string& path, const std::string& prefix) {
    std::vector<std::string> segments;
    if (path.compare(0, prefix.size(), prefix) != 0) {
        return segments;
    }

    std::string rest = path.substr(prefix.size());
    auto query = rest.find('?');
    if (query != std::string::npos) {
        rest = rest.substr(0, query);
    }

    size_t start = 0;
    while (start <= rest.size()) {
        auto slash = rest.find('/', start);
        std::string segment = rest.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
        if (!segment.empty()) {
            segments.push_back(segment);
        }
        if (slash == std::string::npos) {
            break;
        }
        start = slash + 1;
    }
    return segments;
}

/**
 * @brief Выполнить обработчик с проверкой владельца и переводом исключений в HTTP статусы
 *
 * @param component Префикс для лога
 * @param action void(const std::string& ownerId)
 */
template <typename Action>
void guarded(const char* component, IRequest& req, IResponse& res, Action&& action) {
    auto owner = ownerId(req);
    if (!owner) {
        sendError(res, 401, "X-Owner-Id header is required", "Unauthorized");
        return;
    }

    try {
        action(*owner);
    } catch (const domain::LedgerException& e) {
        sendError(res, statusFor(e.kind()), e.what(), domain::toString(e.kind()));
    } catch (const nlohmann::json::exception& e) {
        sendError(res, 400, std::string("Invalid JSON: ") + e.what(), "BadRequest");
    } catch (const std::invalid_argument& e) {
        // Неверная дата, сумма или значение перечисления в запросе
        sendError(res, 400, e.what(), "BadRequest");
    } catch (const std::exception& e) {
        std::cerr << "[" << component << "] " << req.getMethod() << " " << req.getPath()
                  << " failed: " << e.what() << std::endl;
        sendError(res, 500, "Internal server error", "Internal");
    }
}

inline void notFound(IResponse& res) {
    sendError(res, 404, "Not found", "NotFound");
}

} // namespace http

} // namespace budget::adapters::primary
