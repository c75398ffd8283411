#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "mcp/result_envelope.hpp"
#include "host/file_ops.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "read_file_content".

static json handle_read_file_content(const json &arguments) {
    std::string file_path = arguments["file_path"].get<std::string>();
    return result_envelope::encode(file_ops::read_file(file_path));
}

namespace tool_read_file_content {

void register_tool(mcp_tools::ToolRegistry &registry) {
    registry.register_tool({
        "read_file_content",
        "Read contents from a file. Returns content (file contents if successful), "
        "success, and error (message if unsuccessful).",
        {
            {"file_path", mcp_tools::ParameterType::String, "Path to the file to read", true, std::nullopt}
        },
        handle_read_file_content
    });
}

} // namespace tool_read_file_content
