#include "smcp/types.hpp"

namespace smcp {

// ---------- ToolContent ----------

ToolContent text_content(std::string text) {
    ToolContent c;
    c.type = "text";
    c.text = std::move(text);
    return c;
}

std::vector<ToolContent> normalize_content(ToolOutput output) {
    if (auto* many = std::get_if<std::vector<ToolContent>>(&output)) {
        return std::move(*many);
    }
    std::vector<ToolContent> items;
    items.push_back(std::move(std::get<ToolContent>(output)));
    return items;
}

void to_json(nlohmann::json& j, const ToolContent& c) {
    j = c.extra.is_object() ? c.extra : nlohmann::json::object();
    j["type"] = c.type;
    if (c.text) j["text"] = *c.text;
}

// ---------- ToolDefinition ----------

void to_json(nlohmann::json& j, const ToolDefinition& t) {
    j = {{"name", t.name}, {"description", t.description}, {"inputSchema", t.input_schema}};
}

// ---------- CallToolResult ----------

void to_json(nlohmann::json& j, const CallToolResult& t) {
    j = nlohmann::json::object();
    j["content"] = nlohmann::json::array();
    for (const auto& c : t.content) {
        nlohmann::json cj;
        to_json(cj, c);
        j["content"].push_back(cj);
    }
}

// ---------- Capabilities ----------

void to_json(nlohmann::json& j, const ServerCapabilities& t) {
    j = nlohmann::json::object();
    if (t.tools) j["tools"] = *t.tools;
}

void to_json(nlohmann::json& j, const Implementation& t) {
    j = {{"name", t.name}, {"version", t.version}};
}

void to_json(nlohmann::json& j, const InitializeResult& t) {
    j = {
        {"protocolVersion", t.protocol_version},
        {"capabilities", t.capabilities},
        {"serverInfo", t.server_info}
    };
}

} // namespace smcp
