#pragma once
#include <memory>
#include <string_view>
#include <spdlog/spdlog.h>

namespace smcp {

constexpr std::string_view LOGGER_NAME = "simple-mcp-server";

/// Diagnostic logger. Writes to stderr; stdout is reserved for protocol traffic.
std::shared_ptr<spdlog::logger> logger();

void set_log_level(spdlog::level::level_enum level);

} // namespace smcp
