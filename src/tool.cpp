#include "smcp/tool.hpp"
#include "smcp/error.hpp"
#include <algorithm>

namespace smcp {

ToolDefinition Tool::definition() const {
    return ToolDefinition{name(), description(), input_schema()};
}

FunctionTool::FunctionTool(ToolDefinition def, ToolHandler handler)
    : def_(std::move(def)), handler_(std::move(handler)) {
    if (!handler_) {
        throw McpError("Tool '" + def_.name + "' has no handler");
    }
}

ToolOutput FunctionTool::execute(const nlohmann::json& arguments) const {
    return handler_(arguments);
}

void ToolRegistry::add(std::unique_ptr<Tool> tool) {
    if (!tool) {
        throw McpError("Cannot register a null tool");
    }
    if (tool->name().empty()) {
        throw McpError("Tool name must not be empty");
    }
    if (find(tool->name()) != nullptr) {
        throw McpError("Tool already registered: " + tool->name());
    }
    tools_.push_back(std::move(tool));
}

const Tool* ToolRegistry::find(const std::string& name) const {
    auto it = std::find_if(tools_.begin(), tools_.end(),
        [&name](const std::unique_ptr<Tool>& t) { return t->name() == name; });
    return it == tools_.end() ? nullptr : it->get();
}

std::vector<ToolDefinition> ToolRegistry::definitions() const {
    std::vector<ToolDefinition> defs;
    defs.reserve(tools_.size());
    for (const auto& t : tools_) {
        defs.push_back(t->definition());
    }
    return defs;
}

} // namespace smcp
