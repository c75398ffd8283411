#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "mcp/result_envelope.hpp"
#include "host/file_ops.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "list_directory".

static json handle_list_directory(const json &arguments) {
    std::string directory = arguments["directory"].get<std::string>();
    return result_envelope::encode(file_ops::list_directory(directory));
}

namespace tool_list_directory {

void register_tool(mcp_tools::ToolRegistry &registry) {
    registry.register_tool({
        "list_directory",
        "List contents of a directory. Returns contents (list of entry names), "
        "success, and error (message if unsuccessful).",
        {
            {"directory", mcp_tools::ParameterType::String,
             "Directory path to list. Defaults to current directory", false, json(".")}
        },
        handle_list_directory
    });
}

} // namespace tool_list_directory
