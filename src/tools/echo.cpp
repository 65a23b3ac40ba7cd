#include "smcp/tools/echo.hpp"
#include <stdexcept>

namespace smcp {

EchoTool::EchoTool()
    : name_("echo"),
      description_("Returns the specified message as is"),
      schema_({
          {"type", "object"},
          {"properties", {
              {"message", {{"type", "string"}, {"description", "The string to echo"}}}
          }},
          {"required", {"message"}}
      }) {
}

ToolOutput EchoTool::execute(const nlohmann::json& arguments) const {
    auto it = arguments.find("message");
    if (it == arguments.end() || !it->is_string()) {
        throw std::invalid_argument("invalid type for 'message'");
    }
    return text_content("Echo: " + it->get<std::string>());
}

} // namespace smcp
