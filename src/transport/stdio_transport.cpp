#include "smcp/transport/stdio_transport.hpp"
#include "smcp/error.hpp"
#include "smcp/logging.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <cerrno>
#include <cstring>
#include <exception>
#include <string>

namespace smcp {

namespace {

constexpr std::string_view LINE_WHITESPACE = " \t\r\f\v";

void require_open(int fd, const char* role) {
    struct stat st;
    if (::fstat(fd, &st) < 0) {
        throw McpTransportError(std::string("Invalid ") + role + " descriptor " + std::to_string(fd)
                                + ": " + strerror(errno));
    }
}

} // anonymous namespace

StdioTransport::StdioTransport()
    : StdioTransport(STDIN_FILENO, STDOUT_FILENO) {
    owns_fds_ = false;
}

StdioTransport::StdioTransport(int read_fd, int write_fd)
    : read_fd_(read_fd), write_fd_(write_fd), owns_fds_(true) {
    // Checked before pipe() can hand out a closed stdio slot as the wakeup fd.
    require_open(read_fd_, "input");
    require_open(write_fd_, "output");

    if (pipe(wakeup_pipe_) < 0) {
        throw McpTransportError(std::string("Failed to create wakeup pipe: ") + strerror(errno));
    }

    // Set non-blocking on write end of wakeup pipe
    int flags = fcntl(wakeup_pipe_[1], F_GETFL, 0);
    fcntl(wakeup_pipe_[1], F_SETFL, flags | O_NONBLOCK);
}

StdioTransport::~StdioTransport() {
    if (owns_fds_) {
        if (read_fd_ >= 0)  ::close(read_fd_);
        if (write_fd_ >= 0) ::close(write_fd_);
    }
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

void StdioTransport::start(MessageCallback on_message, ErrorCallback on_error) {
    // If shutdown() was called before start(), return without blocking.
    if (shutdown_requested_.load()) return;
    if (running_.exchange(true)) {
        return; // already running
    }
    try {
        read_loop(on_message, on_error);
    } catch (...) {
        running_ = false;
        throw;
    }
    running_ = false;
}

void StdioTransport::read_loop(const MessageCallback& on_message, const ErrorCallback& on_error) {
    std::string buffer;
    buffer.reserve(4096);

    char chunk[4096];

    while (running_) {
        // Use poll() so that shutdown() can interrupt the blocking read
        // via the wakeup pipe.
        struct pollfd fds[2];
        fds[0].fd = read_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            auto err = std::make_exception_ptr(
                McpTransportError(std::string("Poll error: ") + strerror(errno)));
            if (!on_error) std::rethrow_exception(err);
            on_error(err);
            break;
        }

        // Wakeup pipe readable: shutdown() was called
        if (fds[1].revents & POLLIN) break;

        if (fds[0].revents & POLLNVAL) {
            auto err = std::make_exception_ptr(
                McpTransportError("Read error: input descriptor is not open"));
            if (!on_error) std::rethrow_exception(err);
            on_error(err);
            break;
        }

        // A closed pipe reports POLLHUP without POLLIN; read() then sees EOF.
        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) continue;
            if (!running_) break;
            auto err = std::make_exception_ptr(
                McpTransportError(std::string("Read error: ") + strerror(errno)));
            if (!on_error) std::rethrow_exception(err);
            on_error(err);
            break;
        }
        if (n == 0) {
            // EOF: an unterminated last line still counts as a line
            if (!buffer.empty()) {
                handle_line(buffer, on_message, on_error);
                buffer.clear();
            }
            logger()->debug("Input closed");
            break;
        }

        buffer.append(chunk, static_cast<size_t>(n));

        // Process complete lines
        size_t pos = 0;
        while (running_) {
            size_t nl = buffer.find('\n', pos);
            if (nl == std::string::npos) break;

            std::string_view line(buffer.data() + pos, nl - pos);
            pos = nl + 1;
            handle_line(line, on_message, on_error);
        }

        if (pos > 0) {
            buffer.erase(0, pos);
        }
    }
}

void StdioTransport::handle_line(std::string_view line, const MessageCallback& on_message,
                                 const ErrorCallback& on_error) {
    // Remove trailing \r if present (CRLF)
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    if (line.find_first_not_of(LINE_WHITESPACE) == std::string_view::npos) return;

    std::exception_ptr failure;
    JsonRpcMessage msg;
    try {
        msg = Codec::parse(line);
    } catch (const McpError& e) {
        if (!on_error) {
            logger()->warn("Dropping undecodable line: {}", e.what());
            return;
        }
        failure = std::current_exception();
    }

    // Callbacks run outside the try so their own exceptions propagate.
    if (failure) {
        on_error(failure);
        return;
    }
    on_message(std::move(msg));
}

void StdioTransport::write_all(const std::string& data) {
    const char* p = data.data();
    size_t remaining = data.size();

    while (remaining > 0) {
        ssize_t written = ::write(write_fd_, p, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            throw McpTransportError(std::string("Write error: ") + strerror(errno));
        }
        p += written;
        remaining -= static_cast<size_t>(written);
    }
}

void StdioTransport::send(const JsonRpcResponse& resp) {
    std::string line = Codec::serialize(resp);
    line += '\n';
    write_all(line);
}

void StdioTransport::shutdown() {
    shutdown_requested_ = true;
    if (!running_.exchange(false)) {
        // start() hasn't been called yet (or already finished).
        return;
    }
    // Write to wakeup pipe to interrupt poll() in read_loop().
    if (wakeup_pipe_[1] >= 0) {
        char b = 1;
        if (::write(wakeup_pipe_[1], &b, 1) < 0 && errno != EAGAIN) {
            logger()->warn("Failed to signal shutdown: {}", strerror(errno));
        }
    }
}

} // namespace smcp
