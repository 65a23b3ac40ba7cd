#include <benchmark/benchmark.h>
#include "smcp/server.hpp"
#include "smcp/router.hpp"
#include "smcp/tools/echo.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace smcp;

static std::unique_ptr<McpServer> make_server(int extra_tools) {
    McpServer::Options opts;
    opts.log_level = spdlog::level::off;
    auto server = std::make_unique<McpServer>(opts);
    server->add_tool(std::make_unique<EchoTool>());
    for (int i = 0; i < extra_tools; ++i) {
        ToolDefinition def;
        def.name = "tool_" + std::to_string(i);
        def.input_schema = {{"type", "object"}};
        server->add_tool(def, [](const nlohmann::json&) -> ToolOutput {
            return text_content("ok");
        });
    }
    return server;
}

static void BM_DispatchToolsList(benchmark::State& state) {
    auto server = make_server(static_cast<int>(state.range(0)));

    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "tools/list";

    for (auto _ : state) {
        auto resp = server->handle_message(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchToolsList)->Arg(0)->Arg(100)->MinTime(1.0);

static void BM_DispatchEchoCall(benchmark::State& state) {
    auto server = make_server(0);

    JsonRpcRequest req;
    req.id = RequestId{int64_t{3}};
    req.method = "tools/call";
    req.params = nlohmann::json{{"name", "echo"}, {"arguments", {{"message", "Hello MCP!"}}}};

    for (auto _ : state) {
        auto resp = server->handle_message(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchEchoCall)->MinTime(1.0);

static void BM_DispatchLastOfManyTools(benchmark::State& state) {
    auto server = make_server(100);

    JsonRpcRequest req;
    req.id = RequestId{int64_t{3}};
    req.method = "tools/call";
    req.params = nlohmann::json{{"name", "tool_99"}, {"arguments", nlohmann::json::object()}};

    for (auto _ : state) {
        auto resp = server->handle_message(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchLastOfManyTools)->MinTime(1.0);

static void BM_DispatchUnknownMethod(benchmark::State& state) {
    auto server = make_server(0);

    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "not_registered_method";

    for (auto _ : state) {
        auto resp = server->handle_message(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchUnknownMethod)->MinTime(1.0);

static void BM_DispatchNotification(benchmark::State& state) {
    Router router;
    router.on_notification("notifications/initialized", [](const nlohmann::json&) {});

    JsonRpcNotification notif;
    notif.method = "notifications/initialized";

    for (auto _ : state) {
        auto resp = router.dispatch(notif);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchNotification)->MinTime(1.0);
