#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "mcp/result_envelope.hpp"
#include "host/file_ops.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "get_file_info".

static json handle_get_file_info(const json &arguments) {
    std::string file_path = arguments["file_path"].get<std::string>();
    return result_envelope::encode(file_ops::get_file_info(file_path));
}

namespace tool_get_file_info {

void register_tool(mcp_tools::ToolRegistry &registry) {
    registry.register_tool({
        "get_file_info",
        "Get information about a file (size, modification time, etc). Returns info with "
        "size (bytes), modified_time and created_time (epoch seconds), is_directory and "
        "is_file, plus success, and error (message if unsuccessful).",
        {
            {"file_path", mcp_tools::ParameterType::String, "Path to the file", true, std::nullopt}
        },
        handle_get_file_info
    });
}

} // namespace tool_get_file_info
