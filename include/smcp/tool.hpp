#pragma once
#include "types.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace smcp {

/// A named, schema-described callable exposed through tools/list and tools/call.
/// Implementations signal failure by throwing; the dispatcher reports any
/// exception as an internal error without leaking its message.
class Tool {
public:
    virtual ~Tool() = default;

    [[nodiscard]] virtual const std::string& name() const = 0;
    [[nodiscard]] virtual const std::string& description() const = 0;
    [[nodiscard]] virtual const nlohmann::json& input_schema() const = 0;

    /// Run the tool. `arguments` is always a JSON object.
    virtual ToolOutput execute(const nlohmann::json& arguments) const = 0;

    /// The catalog entry for this tool (execute is never exposed).
    [[nodiscard]] ToolDefinition definition() const;
};

using ToolHandler = std::function<ToolOutput(const nlohmann::json& arguments)>;

/// Tool backed by a definition and a callable.
class FunctionTool : public Tool {
public:
    FunctionTool(ToolDefinition def, ToolHandler handler);

    const std::string& name() const override { return def_.name; }
    const std::string& description() const override { return def_.description; }
    const nlohmann::json& input_schema() const override { return def_.input_schema; }

    ToolOutput execute(const nlohmann::json& arguments) const override;

private:
    ToolDefinition def_;
    ToolHandler handler_;
};

/// Ordered tool collection. Registration order is catalog order.
class ToolRegistry {
public:
    ToolRegistry() = default;
    ToolRegistry(ToolRegistry&&) = default;
    ToolRegistry& operator=(ToolRegistry&&) = default;
    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    /// Throws McpError on an empty or already registered name.
    void add(std::unique_ptr<Tool> tool);

    /// Returns nullptr when no tool has that name.
    [[nodiscard]] const Tool* find(const std::string& name) const;

    [[nodiscard]] std::vector<ToolDefinition> definitions() const;

    [[nodiscard]] size_t size() const { return tools_.size(); }
    [[nodiscard]] bool empty() const { return tools_.empty(); }

private:
    std::vector<std::unique_ptr<Tool>> tools_;
};

} // namespace smcp
