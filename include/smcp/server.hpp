#pragma once
#include "json_rpc.hpp"
#include "tool.hpp"
#include "types.hpp"
#include "version.hpp"
#include "transport/transport.hpp"
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <spdlog/common.h>

namespace smcp {

class McpServer {
public:
    struct Options {
        Implementation server_info{std::string(SERVER_NAME), std::string(SERVER_VERSION)};
        /// Answered to initialize when the client sends no protocolVersion.
        std::string default_protocol_version{DEFAULT_PROTOCOL_VERSION};
        spdlog::level::level_enum log_level = spdlog::level::info;
    };

    McpServer();
    explicit McpServer(Options opts);
    ~McpServer();

    // Non-copyable, non-movable
    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    // ---- Tool registration (before serving) ----
    void add_tool(std::unique_ptr<Tool> tool);
    void add_tool(ToolDefinition def, ToolHandler handler);

    [[nodiscard]] const ToolRegistry& tools() const;

    // ---- Dispatch ----

    /// Route a decoded message. Returns the response to write, if any.
    [[nodiscard]] std::optional<JsonRpcResponse> handle_message(const JsonRpcMessage& msg) const;

    /// Turn a decode failure into its error response (-32700 or -32600).
    /// Any other exception, such as McpTransportError, is rethrown.
    [[nodiscard]] std::optional<JsonRpcResponse> handle_error(std::exception_ptr error) const;

    // ---- Transport ----

    /// Serve until end of input. Transport failures propagate as McpTransportError.
    void serve(std::unique_ptr<ITransport> transport);
    void serve_stdio();
    void shutdown();

    bool is_running() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace smcp
