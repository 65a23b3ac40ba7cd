#include "smcp/server.hpp"
#include "smcp/codec.hpp"
#include "smcp/error.hpp"
#include "smcp/handlers.hpp"
#include "smcp/logging.hpp"
#include "smcp/router.hpp"
#include "smcp/transport/stdio_transport.hpp"

#include <atomic>
#include <mutex>
#include <string>

namespace smcp {

// ----------- McpServer::Impl -----------

struct McpServer::Impl {
    Options opts;
    ToolRegistry registry;
    Router router;

    // Transport reference, for shutdown() from another thread
    ITransport* transport{nullptr};
    std::mutex transport_mutex;

    std::atomic<bool> running{false};

    explicit Impl(Options o) : opts(std::move(o)) {}

    void setup_handlers() {
        // initialize
        router.on_request("initialize", [this](const nlohmann::json& params) -> HandlerResult {
            return handlers::initialize(params, opts.server_info, opts.default_protocol_version);
        });

        // initialized: both spellings are accepted and never answered
        auto on_initialized = [](const nlohmann::json&) {
            logger()->debug("Client reported initialization complete");
        };
        router.on_notification("initialized", on_initialized);
        router.on_notification("notifications/initialized", on_initialized);

        // cancelled: requests run to completion before the next line is read,
        // so there is never anything in flight to cancel.
        router.on_notification("cancelled", [](const nlohmann::json&) {});

        // tools/list
        router.on_request("tools/list", [this](const nlohmann::json&) -> HandlerResult {
            return handlers::tools_list(registry);
        });

        // tools/call
        router.on_request("tools/call", [this](const nlohmann::json& params) -> HandlerResult {
            return handlers::tools_call(registry, params);
        });

        // resources/list, prompts/list
        router.on_request("resources/list", [](const nlohmann::json&) -> HandlerResult {
            return handlers::resources_list();
        });
        router.on_request("prompts/list", [](const nlohmann::json&) -> HandlerResult {
            return handlers::prompts_list();
        });
    }
};

// ----------- McpServer -----------

McpServer::McpServer()
    : McpServer(Options{}) {
}

McpServer::McpServer(Options opts)
    : impl_(std::make_unique<Impl>(std::move(opts))) {
    set_log_level(impl_->opts.log_level);
    impl_->setup_handlers();
}

McpServer::~McpServer() = default;

void McpServer::add_tool(std::unique_ptr<Tool> tool) {
    const std::string name = tool ? tool->name() : std::string();
    impl_->registry.add(std::move(tool));
    logger()->debug("Registered tool '{}'", name);
}

void McpServer::add_tool(ToolDefinition def, ToolHandler handler) {
    add_tool(std::make_unique<FunctionTool>(std::move(def), std::move(handler)));
}

const ToolRegistry& McpServer::tools() const {
    return impl_->registry;
}

std::optional<JsonRpcResponse> McpServer::handle_message(const JsonRpcMessage& msg) const {
    logger()->debug("Dispatching {} '{}'",
                    std::holds_alternative<JsonRpcRequest>(msg) ? "request" : "notification",
                    method_of(msg));
    return impl_->router.dispatch(msg);
}

std::optional<JsonRpcResponse> McpServer::handle_error(std::exception_ptr error) const {
    try {
        std::rethrow_exception(error);
    } catch (const McpInvalidRequest& e) {
        logger()->warn("Invalid request: {}", e.what());
        return JsonRpcResponse::failure(e.id, error::InvalidRequest, "Invalid Request");
    } catch (const McpParseError& e) {
        logger()->warn("Unparseable input: {}", e.what());
        return JsonRpcResponse::failure(std::nullopt, error::ParseError, "Parse error");
    }
}

void McpServer::serve(std::unique_ptr<ITransport> transport) {
    auto* t = transport.get();
    {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        impl_->transport = t;
    }
    impl_->running = true;
    logger()->info("Serving {} tool(s)", impl_->registry.size());

    auto finish = [this] {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        impl_->transport = nullptr;
        impl_->running = false;
    };

    try {
        t->start(
            [this, t](JsonRpcMessage msg) {
                if (auto response = handle_message(msg)) {
                    t->send(*response);
                }
            },
            [this, t](std::exception_ptr error) {
                if (auto response = handle_error(error)) {
                    t->send(*response);
                }
            });
    } catch (...) {
        finish();
        throw;
    }

    finish();
    logger()->info("Input closed, server stopped");
}

void McpServer::serve_stdio() {
    serve(std::make_unique<StdioTransport>());
}

void McpServer::shutdown() {
    std::lock_guard<std::mutex> lock(impl_->transport_mutex);
    if (impl_->transport) {
        impl_->transport->shutdown();
    }
}

bool McpServer::is_running() const {
    return impl_->running;
}

} // namespace smcp
