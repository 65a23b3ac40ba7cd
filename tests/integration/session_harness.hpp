#pragma once
#include "smcp/server.hpp"
#include "smcp/transport/stdio_transport.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <unistd.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace smcp {
namespace test_support {

struct SessionOutput {
    std::string raw;
    std::vector<nlohmann::json> responses;
};

/// Feed `input` to the server over a pipe, close it, and collect every
/// line the server wrote until it stopped.
inline SessionOutput run_session(McpServer& server, const std::string& input) {
    int in[2], out[2];
    if (pipe(in) < 0 || pipe(out) < 0) {
        throw std::runtime_error("pipe failed");
    }

    std::thread writer([&] {
        const char* p = input.data();
        size_t remaining = input.size();
        while (remaining > 0) {
            ssize_t n = ::write(in[1], p, remaining);
            if (n <= 0) break;
            p += n;
            remaining -= static_cast<size_t>(n);
        }
        ::close(in[1]);
    });

    SessionOutput result;
    std::thread reader([&] {
        char buf[4096];
        ssize_t n;
        while ((n = ::read(out[0], buf, sizeof(buf))) > 0) {
            result.raw.append(buf, static_cast<size_t>(n));
        }
    });

    // The transport owns in[0] and out[1] and closes them when serve returns.
    server.serve(std::make_unique<StdioTransport>(in[0], out[1]));

    writer.join();
    reader.join();
    ::close(out[0]);

    size_t pos = 0;
    while (pos < result.raw.size()) {
        size_t nl = result.raw.find('\n', pos);
        if (nl == std::string::npos) {
            ADD_FAILURE() << "unterminated output line: " << result.raw.substr(pos);
            break;
        }
        result.responses.push_back(nlohmann::json::parse(result.raw.substr(pos, nl - pos)));
        pos = nl + 1;
    }
    return result;
}

} // namespace test_support
} // namespace smcp
