#ifndef CMCPS_TOOL_HANDLERS_HPP
#define CMCPS_TOOL_HANDLERS_HPP

// Tool handler registration.
// Each tool_*.cpp file provides a register function that is called during startup.

#include "config/server_config.hpp"
#include "mcp/mcp_tools.hpp"

namespace tool_handlers {

// Register all available tool handlers with registry, in catalog order, then mark
// the registry ready. config is copied into the handlers that need it.
void register_all_tools(mcp_tools::ToolRegistry &registry, const server_config::ServerConfig &config);

} // namespace tool_handlers

#endif // CMCPS_TOOL_HANDLERS_HPP
