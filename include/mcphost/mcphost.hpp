#pragma once

/// Umbrella header for the mcphost server-orchestration library.

#include "version.hpp"
#include "error.hpp"
#include "log.hpp"
#include "security.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "framer.hpp"
#include "types.hpp"
#include "config.hpp"
#include "channel.hpp"
#include "pending_requests.hpp"
#include "router.hpp"
#include "backoff.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
#include "protocol_client.hpp"
#include "process.hpp"
#include "supervisor.hpp"
#include "connection.hpp"
#include "registry.hpp"
#include "health.hpp"
