#include <gtest/gtest.h>
#include "session_harness.hpp"
#include "smcp/error.hpp"
#include "smcp/tools/echo.hpp"
#include <unistd.h>
#include <algorithm>
#include <chrono>
#include <thread>

using namespace smcp;
using smcp::test_support::run_session;

namespace {

McpServer::Options quiet() {
    McpServer::Options opts;
    opts.log_level = spdlog::level::off;
    return opts;
}

std::string call_line(const nlohmann::json& id, const std::string& message) {
    nlohmann::json req = {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", "tools/call"},
        {"params", {{"name", "echo"}, {"arguments", {{"message", message}}}}},
    };
    return req.dump() + "\n";
}

class ProtocolInvariants : public ::testing::Test {
protected:
    ProtocolInvariants() : server(quiet()) {
        server.add_tool(std::make_unique<EchoTool>());
    }

    McpServer server;
};

} // namespace

TEST_F(ProtocolInvariants, OneResponsePerRequestInInputOrder) {
    std::string input;
    for (int i = 0; i < 50; ++i) {
        input += call_line(i, "m" + std::to_string(i));
        input += R"({"jsonrpc":"2.0","method":"notifications/initialized"})" "\n";
    }

    auto out = run_session(server, input);
    ASSERT_EQ(out.responses.size(), 50u);
    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(out.responses[i]["id"], i);
        EXPECT_EQ(out.responses[i]["result"]["content"][0]["text"], "Echo: m" + std::to_string(i));
    }
}

TEST_F(ProtocolInvariants, IdIsEchoedWithItsType) {
    auto out = run_session(server,
        call_line("7", "a") + call_line(7, "b") + call_line(2.5, "c") + call_line(-3, "d"));

    ASSERT_EQ(out.responses.size(), 4u);
    EXPECT_TRUE(out.responses[0]["id"].is_string());
    EXPECT_EQ(out.responses[0]["id"], "7");
    EXPECT_TRUE(out.responses[1]["id"].is_number_integer());
    EXPECT_EQ(out.responses[1]["id"], 7);
    EXPECT_TRUE(out.responses[2]["id"].is_number_float());
    EXPECT_EQ(out.responses[2]["id"], 2.5);
    EXPECT_EQ(out.responses[3]["id"], -3);
}

TEST_F(ProtocolInvariants, ExactlyOneOfResultOrError) {
    auto out = run_session(server,
        call_line(1, "ok") +
        R"({"jsonrpc":"2.0","method":"nope","id":2})" "\n"
        "INVALID_JSON\n" +
        R"({"jsonrpc":"2.0","method":"resources/list","id":3})" "\n");

    ASSERT_EQ(out.responses.size(), 4u);
    for (const auto& r : out.responses) {
        EXPECT_EQ(r["jsonrpc"], "2.0");
        EXPECT_TRUE(r.contains("id"));
        EXPECT_NE(r.contains("result"), r.contains("error"));
        if (r.contains("error")) {
            EXPECT_TRUE(r["error"]["code"].is_number_integer());
            EXPECT_TRUE(r["error"]["message"].is_string());
        }
    }
}

TEST_F(ProtocolInvariants, NoEmbeddedNewlinesInOutput) {
    auto out = run_session(server, call_line(1, "line one\nline two\r\nline three"));
    ASSERT_EQ(out.responses.size(), 1u);
    EXPECT_EQ(std::count(out.raw.begin(), out.raw.end(), '\n'), 1);
    EXPECT_EQ(out.responses[0]["result"]["content"][0]["text"], "Echo: line one\nline two\r\nline three");
}

TEST_F(ProtocolInvariants, CrlfAndBlankLinesAreTolerated) {
    std::string input = "\r\n\n  \n";
    input += R"({"jsonrpc":"2.0","method":"tools/list","id":1})" "\r\n";
    input += "\t\n";
    input += R"({"jsonrpc":"2.0","method":"prompts/list","id":2})";  // no trailing newline

    auto out = run_session(server, input);
    ASSERT_EQ(out.responses.size(), 2u);
    EXPECT_EQ(out.responses[0]["id"], 1);
    EXPECT_EQ(out.responses[1]["result"]["prompts"], nlohmann::json::array());
}

TEST_F(ProtocolInvariants, NullIdIsTreatedAsNotification) {
    auto out = run_session(server,
        R"({"jsonrpc":"2.0","method":"tools/list","id":null})" "\n"
        R"({"jsonrpc":"2.0","method":"unknown","id":null})" "\n");
    EXPECT_TRUE(out.raw.empty());
}

TEST_F(ProtocolInvariants, SameRequestSameResponse) {
    const std::string line = call_line("x", "repeat");
    auto out = run_session(server, line + "garbage\n" + line + R"({"jsonrpc":"2.0","method":"initialize","id":9})" "\n" + line);

    ASSERT_EQ(out.responses.size(), 5u);
    EXPECT_EQ(out.responses[0], out.responses[2]);
    EXPECT_EQ(out.responses[0], out.responses[4]);
}

TEST_F(ProtocolInvariants, ShutdownFromAnotherThreadStopsServing) {
    int in[2], out[2];
    ASSERT_EQ(pipe(in), 0);
    ASSERT_EQ(pipe(out), 0);

    std::thread serve_thread([&] {
        server.serve(std::make_unique<StdioTransport>(in[0], out[1]));
    });

    for (int i = 0; i < 200 && !server.is_running(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_TRUE(server.is_running());

    // A request answered before shutdown proves the loop is live
    const std::string line = R"({"jsonrpc":"2.0","method":"tools/list","id":1})" "\n";
    ASSERT_EQ(::write(in[1], line.data(), line.size()), static_cast<ssize_t>(line.size()));

    std::string received;
    char buf[4096];
    while (received.find('\n') == std::string::npos) {
        ssize_t n = ::read(out[0], buf, sizeof(buf));
        ASSERT_GT(n, 0);
        received.append(buf, static_cast<size_t>(n));
    }
    EXPECT_EQ(nlohmann::json::parse(received)["id"], 1);

    server.shutdown();
    serve_thread.join();
    EXPECT_FALSE(server.is_running());

    ::close(in[1]);
    ::close(out[0]);
}
