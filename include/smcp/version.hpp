#pragma once
#include <string_view>

namespace smcp {

constexpr std::string_view SERVER_NAME               = "simple-mcp-server";
constexpr std::string_view SERVER_VERSION            = "0.1.0";
constexpr std::string_view DEFAULT_PROTOCOL_VERSION  = "2025-03-08";
constexpr std::string_view JSONRPC_VERSION           = "2.0";

} // namespace smcp
