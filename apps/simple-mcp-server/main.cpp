/// simple-mcp-server: minimal MCP server exposing the echo tool.
/// Usage: ./simple-mcp-server
/// Communicates over stdio (newline-delimited JSON-RPC); logs go to stderr.

#include <smcp/smcp.hpp>
#include <csignal>
#include <exception>
#include <memory>

int main() {
    // A vanished client must surface as a write error, not kill the process.
    std::signal(SIGPIPE, SIG_IGN);

    try {
        smcp::McpServer server;
        server.add_tool(std::make_unique<smcp::EchoTool>());

        // Blocks until end of input
        server.serve_stdio();
    } catch (const std::exception& e) {
        smcp::logger()->critical("Fatal: {}", e.what());
        return 1;
    }
    return 0;
}
