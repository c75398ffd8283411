#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"

// Forward declarations of individual tool registration functions.
// Each tool_*.cpp defines its own namespace with a register_tool() function.

namespace tool_execute_command { void register_tool(mcp_tools::ToolRegistry &, const server_config::ServerConfig &); }
namespace tool_read_file_content { void register_tool(mcp_tools::ToolRegistry &); }
namespace tool_write_file_content { void register_tool(mcp_tools::ToolRegistry &); }
namespace tool_append_to_file { void register_tool(mcp_tools::ToolRegistry &); }
namespace tool_search_web { void register_tool(mcp_tools::ToolRegistry &, const server_config::ServerConfig &); }
namespace tool_fetch_url { void register_tool(mcp_tools::ToolRegistry &, const server_config::ServerConfig &); }
namespace tool_create_plan { void register_tool(mcp_tools::ToolRegistry &, const server_config::ServerConfig &); }
namespace tool_append_plan { void register_tool(mcp_tools::ToolRegistry &, const server_config::ServerConfig &); }
namespace tool_read_plan { void register_tool(mcp_tools::ToolRegistry &, const server_config::ServerConfig &); }
namespace tool_list_directory { void register_tool(mcp_tools::ToolRegistry &); }
namespace tool_get_file_info { void register_tool(mcp_tools::ToolRegistry &); }
namespace tool_create_directory { void register_tool(mcp_tools::ToolRegistry &); }

namespace tool_handlers {

void register_all_tools(mcp_tools::ToolRegistry &registry, const server_config::ServerConfig &config) {
    tool_execute_command::register_tool(registry, config);
    tool_read_file_content::register_tool(registry);
    tool_write_file_content::register_tool(registry);
    tool_append_to_file::register_tool(registry);
    tool_search_web::register_tool(registry, config);
    tool_fetch_url::register_tool(registry, config);
    tool_create_plan::register_tool(registry, config);
    tool_append_plan::register_tool(registry, config);
    tool_read_plan::register_tool(registry, config);
    tool_list_directory::register_tool(registry);
    tool_get_file_info::register_tool(registry);
    tool_create_directory::register_tool(registry);

    registry.mark_ready();
    debug_log::log("Tool registry ready with " + std::to_string(registry.list_tools().size()) + " tools.");
}

} // namespace tool_handlers
