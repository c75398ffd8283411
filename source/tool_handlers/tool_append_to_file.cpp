#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "mcp/result_envelope.hpp"
#include "host/file_ops.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "append_to_file".

static json handle_append_to_file(const json &arguments) {
    std::string file_path = arguments["file_path"].get<std::string>();
    std::string content = arguments["content"].get<std::string>();
    return result_envelope::encode(file_ops::append_file(file_path, content));
}

namespace tool_append_to_file {

void register_tool(mcp_tools::ToolRegistry &registry) {
    registry.register_tool({
        "append_to_file",
        "Append content to a file. Returns success, and error (message if unsuccessful).",
        {
            {"file_path", mcp_tools::ParameterType::String, "Path to the file", true, std::nullopt},
            {"content", mcp_tools::ParameterType::String, "Content to append", true, std::nullopt}
        },
        handle_append_to_file
    });
}

} // namespace tool_append_to_file
