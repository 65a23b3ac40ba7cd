#pragma once
#include "router.hpp"
#include "tool.hpp"
#include "types.hpp"
#include <optional>
#include <string>

namespace smcp {
namespace handlers {

/// initialize: echo the client's protocolVersion when it is a string,
/// otherwise answer with `default_protocol_version`.
HandlerResult initialize(const nlohmann::json& params,
                         const Implementation& server_info,
                         const std::string& default_protocol_version);

/// tools/list: name, description and inputSchema of every tool, in order.
HandlerResult tools_list(const ToolRegistry& registry);

/// tools/call: validate params and required arguments, then execute.
HandlerResult tools_call(const ToolRegistry& registry, const nlohmann::json& params);

/// resources/list and prompts/list: always empty catalogs.
HandlerResult resources_list();
HandlerResult prompts_list();

/// First name in schema["required"] that is not a key of `arguments`.
/// Non-string entries and a missing or non-array "required" are ignored.
std::optional<std::string> missing_required_argument(const nlohmann::json& schema,
                                                     const nlohmann::json& arguments);

} // namespace handlers
} // namespace smcp
