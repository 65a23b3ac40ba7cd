#include "smcp/json_rpc.hpp"
#include "smcp/version.hpp"

namespace smcp {

JsonRpcResponse JsonRpcResponse::success(std::optional<RequestId> id, nlohmann::json result) {
    JsonRpcResponse resp;
    resp.id = std::move(id);
    resp.result = std::move(result);
    return resp;
}

JsonRpcResponse JsonRpcResponse::failure(std::optional<RequestId> id, int code, std::string message) {
    JsonRpcResponse resp;
    resp.id = std::move(id);
    resp.error = JsonRpcError{code, std::move(message), std::nullopt};
    return resp;
}

void to_json(nlohmann::json& j, const JsonRpcResponse& r) {
    nlohmann::json id_j = nullptr;
    if (r.id) to_json(id_j, *r.id);
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["id"] = id_j;
    // Exactly one of result/error goes on the wire.
    if (r.error) {
        j["error"] = *r.error;
    } else {
        j["result"] = r.result ? *r.result : nlohmann::json::object();
    }
}

const std::string& method_of(const JsonRpcMessage& m) {
    return std::visit([](const auto& v) -> const std::string& { return v.method; }, m);
}

} // namespace smcp
