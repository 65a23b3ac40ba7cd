#pragma once
#include "../tool.hpp"

namespace smcp {

/// Returns "Echo: <message>" as a single text item.
class EchoTool : public Tool {
public:
    EchoTool();

    const std::string& name() const override { return name_; }
    const std::string& description() const override { return description_; }
    const nlohmann::json& input_schema() const override { return schema_; }

    /// Throws std::invalid_argument when `message` is not a string.
    ToolOutput execute(const nlohmann::json& arguments) const override;

private:
    std::string name_;
    std::string description_;
    nlohmann::json schema_;
};

} // namespace smcp
