#include "smcp/router.hpp"
#include "smcp/error.hpp"
#include "smcp/logging.hpp"
#include <exception>

namespace smcp {

void Router::on_request(const std::string& method, RequestHandler handler) {
    request_handlers_[method] = std::move(handler);
}

void Router::on_notification(const std::string& method, NotificationHandler handler) {
    notification_handlers_[method] = std::move(handler);
}

HandlerResult Router::invoke(const std::string& method, const RequestHandler& handler,
                             const nlohmann::json& params) const {
    try {
        return handler(params);
    } catch (const McpProtocolError& e) {
        return JsonRpcError{e.code, e.what(), std::nullopt};
    } catch (const std::exception& e) {
        // The exception text stays in the log; the client sees a generic message.
        logger()->error("Handler for '{}' failed: {}", method, e.what());
        return JsonRpcError{error::InternalError, "Internal error", std::nullopt};
    }
}

void Router::notify(const std::string& method, const NotificationHandler& handler,
                    const nlohmann::json& params) const {
    try {
        handler(params);
    } catch (const std::exception& e) {
        logger()->warn("Notification handler for '{}' failed: {}", method, e.what());
    }
}

std::optional<JsonRpcResponse> Router::dispatch(const JsonRpcMessage& msg) const {
    if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
        const nlohmann::json params = req->params ? *req->params : nlohmann::json();

        auto it = request_handlers_.find(req->method);
        if (it == request_handlers_.end()) {
            auto nit = notification_handlers_.find(req->method);
            if (nit != notification_handlers_.end()) {
                // Silent method: no response even though an id was given
                notify(req->method, nit->second, params);
                return std::nullopt;
            }
            return JsonRpcResponse::failure(req->id, error::MethodNotFound,
                                            "Method not found: " + req->method);
        }

        auto result = invoke(req->method, it->second, params);

        JsonRpcResponse resp;
        resp.id = req->id;
        if (auto* ok = std::get_if<nlohmann::json>(&result)) {
            resp.result = std::move(*ok);
        } else if (auto* err = std::get_if<JsonRpcError>(&result)) {
            resp.error = std::move(*err);
        }
        return resp;
    }

    const auto& notif = std::get<JsonRpcNotification>(msg);
    const nlohmann::json params = notif.params ? *notif.params : nlohmann::json();

    auto nit = notification_handlers_.find(notif.method);
    if (nit != notification_handlers_.end()) {
        notify(notif.method, nit->second, params);
        return std::nullopt;
    }

    auto it = request_handlers_.find(notif.method);
    if (it == request_handlers_.end()) {
        logger()->debug("Ignoring notification for unknown method '{}'", notif.method);
        return std::nullopt;
    }

    // Run it for its effects; notifications never get an answer.
    auto result = invoke(notif.method, it->second, params);
    if (auto* err = std::get_if<JsonRpcError>(&result)) {
        logger()->debug("Notification '{}' failed with {} ({}), not reported",
                        notif.method, err->code, err->message);
    }
    return std::nullopt;
}

} // namespace smcp
