#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "mcp/result_envelope.hpp"
#include "host/web_ops.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "search_web".
// Credentials come from the startup configuration; when they are missing the call
// fails here rather than at startup.

static json handle_search_web(const json &arguments, const server_config::ServerConfig &config) {
    std::string query = arguments["query"].get<std::string>();
    return result_envelope::encode(web_ops::search_web(query, config));
}

namespace tool_search_web {

void register_tool(mcp_tools::ToolRegistry &registry, const server_config::ServerConfig &config) {
    registry.register_tool({
        "search_web",
        "Search the web for information using Google Custom Search API. "
        "Returns results (search results in JSON format), success, and error (message if unsuccessful).",
        {
            {"query", mcp_tools::ParameterType::String, "Search query string", true, std::nullopt}
        },
        [config](const json &arguments) {
            return handle_search_web(arguments, config);
        }
    });
}

} // namespace tool_search_web
