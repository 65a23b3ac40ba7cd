#pragma once
#include "json_rpc.hpp"
#include <functional>
#include <optional>
#include <unordered_map>
#include <string>
#include <variant>

namespace smcp {

using HandlerResult = std::variant<nlohmann::json, JsonRpcError>;

/// `params` is the message's params value, or null when it had none.
using RequestHandler = std::function<HandlerResult(const nlohmann::json& params)>;
using NotificationHandler = std::function<void(const nlohmann::json& params)>;

/// Maps method names onto handlers and handler outcomes onto responses.
///
/// Methods registered with on_notification never produce a response, even
/// when the message carries an id. A notification addressed to a request
/// method still runs the handler; its outcome is discarded.
class Router {
public:
    /// Register a request handler for a method.
    void on_request(const std::string& method, RequestHandler handler);

    /// Register a handler for a method that is never answered.
    void on_notification(const std::string& method, NotificationHandler handler);

    /// Dispatch an incoming message. Returns the response if one is due.
    [[nodiscard]] std::optional<JsonRpcResponse> dispatch(const JsonRpcMessage& msg) const;

private:
    HandlerResult invoke(const std::string& method, const RequestHandler& handler,
                         const nlohmann::json& params) const;
    void notify(const std::string& method, const NotificationHandler& handler,
                const nlohmann::json& params) const;

    std::unordered_map<std::string, RequestHandler> request_handlers_;
    std::unordered_map<std::string, NotificationHandler> notification_handlers_;
};

} // namespace smcp
