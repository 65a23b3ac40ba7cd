#pragma once

/// Umbrella header for the simple-mcp-server library.

#include "version.hpp"
#include "error.hpp"
#include "logging.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "tool.hpp"
#include "router.hpp"
#include "handlers.hpp"
#include "server.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
#include "tools/echo.hpp"
