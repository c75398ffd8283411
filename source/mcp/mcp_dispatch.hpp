#ifndef CMCPS_MCP_DISPATCH_HPP
#define CMCPS_MCP_DISPATCH_HPP

// MCP JSON-RPC method dispatch.

#include <nlohmann/json.hpp>

#include "mcp/mcp_tools.hpp"

namespace mcp_dispatch {

using json = nlohmann::json;

// Protocol version we support.
constexpr const char *PROTOCOL_VERSION = "2024-11-05";

// Server info.
constexpr const char *SERVER_NAME = "cmcps";
constexpr const char *SERVER_VERSION = "0.1.0";

// Dispatch a single JSON-RPC message against registry. Returns the response JSON,
// or a null json value for notifications (which require no response).
json dispatch_message(const json &message,
                      const mcp_tools::ToolRegistry &registry = mcp_tools::global_registry());

// True for "tools/call" requests: the ones the server runs on their own thread.
bool is_tool_call(const json &message);

} // namespace mcp_dispatch

#endif // CMCPS_MCP_DISPATCH_HPP
