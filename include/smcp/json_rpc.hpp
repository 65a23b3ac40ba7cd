#pragma once
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace smcp {

/// Request ids keep their JSON number kind so the echoed id serializes
/// to the same value the client sent.
using RequestId = std::variant<int64_t, uint64_t, double, std::string>;

// Helper to convert RequestId to json
inline void to_json(nlohmann::json& j, const RequestId& id) {
    std::visit([&j](const auto& v) { j = v; }, id);
}

inline void from_json(const nlohmann::json& j, RequestId& id) {
    if (j.is_number_unsigned()) {
        auto v = j.get<uint64_t>();
        if (v <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            id = static_cast<int64_t>(v);
        } else {
            id = v;
        }
    } else if (j.is_number_integer()) {
        id = j.get<int64_t>();
    } else if (j.is_number_float()) {
        id = j.get<double>();
    } else if (j.is_string()) {
        id = j.get<std::string>();
    } else {
        throw std::invalid_argument("RequestId must be a number or string");
    }
}

/// True for the id types JSON-RPC allows on a request (null excluded).
inline bool is_valid_request_id(const nlohmann::json& j) {
    return j.is_number() || j.is_string();
}

struct JsonRpcError {
    int code;
    std::string message;
    std::optional<nlohmann::json> data;

    bool operator==(const JsonRpcError& o) const {
        return code == o.code && message == o.message && data == o.data;
    }
};

inline void to_json(nlohmann::json& j, const JsonRpcError& e) {
    j = nlohmann::json{{"code", e.code}, {"message", e.message}};
    if (e.data) j["data"] = *e.data;
}

struct JsonRpcRequest {
    RequestId id;
    std::string method;
    std::optional<nlohmann::json> params;

    bool operator==(const JsonRpcRequest& o) const {
        return id == o.id && method == o.method && params == o.params;
    }
};

struct JsonRpcNotification {
    std::string method;
    std::optional<nlohmann::json> params;

    bool operator==(const JsonRpcNotification& o) const {
        return method == o.method && params == o.params;
    }
};

/// Outgoing response. A missing id serializes as null.
struct JsonRpcResponse {
    std::optional<RequestId> id;
    std::optional<nlohmann::json> result;
    std::optional<JsonRpcError> error;

    bool operator==(const JsonRpcResponse& o) const {
        return id == o.id && result == o.result && error == o.error;
    }

    static JsonRpcResponse success(std::optional<RequestId> id, nlohmann::json result);
    static JsonRpcResponse failure(std::optional<RequestId> id, int code, std::string message);
};

/// Incoming messages. The server never receives responses.
using JsonRpcMessage = std::variant<JsonRpcRequest, JsonRpcNotification>;

void to_json(nlohmann::json& j, const JsonRpcResponse& r);

/// Method name of a request or notification.
const std::string& method_of(const JsonRpcMessage& m);

} // namespace smcp
