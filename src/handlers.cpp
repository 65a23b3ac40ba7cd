#include "smcp/handlers.hpp"
#include "smcp/error.hpp"
#include "smcp/logging.hpp"
#include <exception>

namespace smcp {
namespace handlers {

HandlerResult initialize(const nlohmann::json& params,
                         const Implementation& server_info,
                         const std::string& default_protocol_version) {
    std::string protocol_version = default_protocol_version;
    if (params.is_object()) {
        auto it = params.find("protocolVersion");
        if (it != params.end() && it->is_string()) {
            // Accept whatever the client speaks; there is no negotiation.
            protocol_version = it->get<std::string>();
        }
    }

    InitializeResult result;
    result.protocol_version = std::move(protocol_version);
    result.capabilities.tools = nlohmann::json::object();
    result.server_info = server_info;

    nlohmann::json j;
    to_json(j, result);
    return j;
}

HandlerResult tools_list(const ToolRegistry& registry) {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& def : registry.definitions()) {
        nlohmann::json tj;
        to_json(tj, def);
        tools.push_back(std::move(tj));
    }
    return nlohmann::json{{"tools", std::move(tools)}};
}

std::optional<std::string> missing_required_argument(const nlohmann::json& schema,
                                                     const nlohmann::json& arguments) {
    if (!schema.is_object()) return std::nullopt;
    auto required = schema.find("required");
    if (required == schema.end() || !required->is_array()) return std::nullopt;

    for (const auto& field : *required) {
        if (!field.is_string()) continue;
        const auto& name = field.get_ref<const std::string&>();
        if (!arguments.contains(name)) return name;
    }
    return std::nullopt;
}

HandlerResult tools_call(const ToolRegistry& registry, const nlohmann::json& params) {
    if (!params.is_object()) {
        return JsonRpcError{error::InvalidParams, "Invalid parameters", std::nullopt};
    }

    auto name_it = params.find("name");
    auto args_it = params.find("arguments");
    if (name_it == params.end() || !name_it->is_string()
        || name_it->get_ref<const std::string&>().empty()
        || args_it == params.end() || args_it->is_null()) {
        return JsonRpcError{error::InvalidParams,
                            "Invalid parameters: missing tool name or arguments", std::nullopt};
    }
    if (!args_it->is_object()) {
        return JsonRpcError{error::InvalidParams,
                            "Invalid parameters: arguments must be an object", std::nullopt};
    }

    const auto& name = name_it->get_ref<const std::string&>();
    const Tool* tool = registry.find(name);
    if (!tool) {
        return JsonRpcError{error::MethodNotFound,
                            "Method not found: tool '" + name + "' is not available", std::nullopt};
    }

    if (auto missing = missing_required_argument(tool->input_schema(), *args_it)) {
        return JsonRpcError{error::InvalidParams,
                            "Missing required parameter: '" + *missing + "'", std::nullopt};
    }

    CallToolResult result;
    try {
        result.content = normalize_content(tool->execute(*args_it));
    } catch (const std::exception& e) {
        logger()->error("Tool '{}' failed: {}", name, e.what());
        return JsonRpcError{error::InternalError, "Internal error during tool execution", std::nullopt};
    } catch (...) {
        logger()->error("Tool '{}' failed with a non-standard exception", name);
        return JsonRpcError{error::InternalError, "Internal error during tool execution", std::nullopt};
    }

    nlohmann::json j;
    to_json(j, result);
    return j;
}

HandlerResult resources_list() {
    return nlohmann::json{{"resources", nlohmann::json::array()}};
}

HandlerResult prompts_list() {
    return nlohmann::json{{"prompts", nlohmann::json::array()}};
}

} // namespace handlers
} // namespace smcp
