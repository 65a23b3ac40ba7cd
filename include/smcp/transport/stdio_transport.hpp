#pragma once
#include "transport.hpp"
#include "../codec.hpp"
#include <atomic>
#include <string>
#include <string_view>

namespace smcp {

/// StdioTransport reads newline-delimited JSON from stdin and writes to stdout.
/// Lines are handled one at a time on the calling thread: a line's response
/// is written before the next line is decoded.
class StdioTransport : public ITransport {
public:
    /// Create transport using system stdin/stdout.
    StdioTransport();

    /// Create transport using specified file descriptors (for testing).
    /// The descriptors are closed on destruction.
    StdioTransport(int read_fd, int write_fd);

    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    void start(MessageCallback on_message, ErrorCallback on_error = nullptr) override;
    void send(const JsonRpcResponse& resp) override;
    void shutdown() override;

private:
    void read_loop(const MessageCallback& on_message, const ErrorCallback& on_error);
    void handle_line(std::string_view line, const MessageCallback& on_message,
                     const ErrorCallback& on_error);
    void write_all(const std::string& data);

    int read_fd_;
    int write_fd_;
    bool owns_fds_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_requested_{false};

    int wakeup_pipe_[2]{-1, -1};  // pipe for interrupting poll() on shutdown
};

} // namespace smcp
