#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "mcp/result_envelope.hpp"
#include "host/web_ops.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "fetch_url".

static json handle_fetch_url(const json &arguments, int timeout_milliseconds) {
    std::string url = arguments["url"].get<std::string>();
    return result_envelope::encode(web_ops::fetch_url(url, timeout_milliseconds));
}

namespace tool_fetch_url {

void register_tool(mcp_tools::ToolRegistry &registry, const server_config::ServerConfig &config) {
    int timeout_milliseconds = config.network_timeout_milliseconds;

    registry.register_tool({
        "fetch_url",
        "Fetch content from a specific URL. Returns content (fetched content), "
        "success, and error (message if unsuccessful).",
        {
            {"url", mcp_tools::ParameterType::String, "URL to fetch content from", true, std::nullopt}
        },
        [timeout_milliseconds](const json &arguments) {
            return handle_fetch_url(arguments, timeout_milliseconds);
        }
    });
}

} // namespace tool_fetch_url
