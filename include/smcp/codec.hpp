#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace smcp {

/// Envelope failure. Carries the request id when the message had one of a
/// legal type, so the error response can echo it.
class McpInvalidRequest : public McpProtocolError {
public:
    std::optional<RequestId> id;
    explicit McpInvalidRequest(const std::string& msg,
                               std::optional<RequestId> id = std::nullopt)
        : McpProtocolError(error::InvalidRequest, msg), id(std::move(id)) {}
};

class Codec {
public:
    /// Parse one input line into a request or notification.
    /// Throws McpParseError on invalid JSON and McpInvalidRequest on a bad envelope.
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// Parse raw bytes into a JSON value. Exactly one value is accepted;
    /// trailing non-whitespace is an error. Throws McpParseError.
    [[nodiscard]] static nlohmann::json parse_json(std::string_view raw);

    /// Validate a decoded JSON value as a JSON-RPC 2.0 request envelope.
    [[nodiscard]] static JsonRpcMessage decode(const nlohmann::json& j);

    /// Serialize a response to a single line of JSON (no trailing newline).
    [[nodiscard]] static std::string serialize(const JsonRpcResponse& resp);
};

} // namespace smcp
