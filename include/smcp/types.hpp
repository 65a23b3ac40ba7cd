#pragma once
#include <string>
#include <vector>
#include <optional>
#include <variant>
#include <nlohmann/json.hpp>

namespace smcp {

// ---------- Content ----------

/// One element of a tool's output, e.g. {"type":"text","text":"..."}.
/// Fields other than type/text are kept in `extra` and written back as-is.
struct ToolContent {
    std::string type;
    std::optional<std::string> text;
    nlohmann::json extra = nlohmann::json::object();

    bool operator==(const ToolContent& o) const {
        return type == o.type && text == o.text && extra == o.extra;
    }
};

ToolContent text_content(std::string text);

/// A tool returns either a single item or an ordered sequence.
using ToolOutput = std::variant<ToolContent, std::vector<ToolContent>>;

/// Wrap a single item into a one-element sequence.
std::vector<ToolContent> normalize_content(ToolOutput output);

// ---------- Tool ----------

struct ToolDefinition {
    std::string name;
    std::string description;
    nlohmann::json input_schema = nlohmann::json::object();

    bool operator==(const ToolDefinition& o) const {
        return name == o.name && description == o.description
               && input_schema == o.input_schema;
    }
};

struct CallToolResult {
    std::vector<ToolContent> content;

    bool operator==(const CallToolResult& o) const {
        return content == o.content;
    }
};

// ---------- Capabilities ----------

struct ServerCapabilities {
    std::optional<nlohmann::json> tools;

    bool operator==(const ServerCapabilities& o) const {
        return tools == o.tools;
    }
};

struct Implementation {
    std::string name;
    std::string version;

    bool operator==(const Implementation& o) const {
        return name == o.name && version == o.version;
    }
};

struct InitializeResult {
    std::string protocol_version;
    ServerCapabilities capabilities;
    Implementation server_info;

    bool operator==(const InitializeResult& o) const {
        return protocol_version == o.protocol_version && capabilities == o.capabilities
               && server_info == o.server_info;
    }
};

// ---------- JSON serialization ----------

void to_json(nlohmann::json& j, const ToolContent& c);

void to_json(nlohmann::json& j, const ToolDefinition& t);

void to_json(nlohmann::json& j, const CallToolResult& t);

void to_json(nlohmann::json& j, const ServerCapabilities& t);

void to_json(nlohmann::json& j, const Implementation& t);

void to_json(nlohmann::json& j, const InitializeResult& t);

} // namespace smcp
