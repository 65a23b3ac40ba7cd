#include <benchmark/benchmark.h>
#include "smcp/codec.hpp"
#include "smcp/json_rpc.hpp"
#include "smcp/types.hpp"
#include <string>
#include <vector>

using namespace smcp;

static const std::string kInitializeRequest =
    R"({"jsonrpc":"2.0","method":"initialize","params":{"protocolVersion":"2025-03-08"},"id":1})";

static const std::string kToolCallRequest =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"echo","arguments":{"message":"Hello MCP!"}}})";

static const std::string kMalformedLine = R"({"jsonrpc":"2.0","method":"tools/list","id":)";

// A tools/list result with N tools
static JsonRpcResponse make_catalog_response(int n) {
    nlohmann::json tools = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        ToolDefinition def;
        def.name = "tool_" + std::to_string(i);
        def.description = "A tool for doing something useful, number " + std::to_string(i);
        def.input_schema = {
            {"type", "object"},
            {"properties", {
                {"param1", {{"type", "string"}, {"description", "First parameter"}}}
            }},
            {"required", {"param1"}}
        };
        nlohmann::json tj;
        to_json(tj, def);
        tools.push_back(std::move(tj));
    }
    return JsonRpcResponse::success(RequestId{int64_t{2}}, nlohmann::json{{"tools", tools}});
}

// ---- Parse benchmarks ----

static void BM_ParseInitialize(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kInitializeRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kInitializeRequest.size());
}
BENCHMARK(BM_ParseInitialize)->MinTime(1.0);

static void BM_ParseToolCall(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kToolCallRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kToolCallRequest.size());
}
BENCHMARK(BM_ParseToolCall)->MinTime(1.0);

static void BM_RejectMalformedLine(benchmark::State& state) {
    for (auto _ : state) {
        try {
            auto msg = Codec::parse(kMalformedLine);
            benchmark::DoNotOptimize(msg);
        } catch (const McpParseError& e) {
            benchmark::DoNotOptimize(e.what());
        }
    }
}
BENCHMARK(BM_RejectMalformedLine)->MinTime(1.0);

// ---- Serialize benchmarks ----

static void BM_SerializeError(benchmark::State& state) {
    auto resp = JsonRpcResponse::failure(RequestId{int64_t{4}}, error::InvalidParams,
                                         "Missing required parameter: 'message'");
    for (auto _ : state) {
        auto s = Codec::serialize(resp);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeError)->MinTime(1.0);

static void BM_SerializeCatalog(benchmark::State& state) {
    auto resp = make_catalog_response(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto s = Codec::serialize(resp);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeCatalog)->Arg(1)->Arg(100)->MinTime(1.0);
