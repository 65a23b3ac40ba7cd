#pragma once
#include "../json_rpc.hpp"
#include <exception>
#include <functional>

namespace smcp {

/// Callback for incoming messages
using MessageCallback = std::function<void(JsonRpcMessage)>;
/// Callback for lines that failed to decode, and for I/O failures.
using ErrorCallback = std::function<void(std::exception_ptr)>;

/// Abstract transport interface
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Start the transport. Blocks until end of input or shutdown().
    virtual void start(MessageCallback on_message,
                       ErrorCallback on_error = nullptr) = 0;

    /// Send a response to the remote peer. Returns once it is written.
    virtual void send(const JsonRpcResponse& resp) = 0;

    /// Graceful shutdown.
    virtual void shutdown() = 0;
};

} // namespace smcp
