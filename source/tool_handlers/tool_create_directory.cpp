#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "mcp/result_envelope.hpp"
#include "host/file_ops.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "create_directory".
// Creates intermediate directories as needed; an existing directory is a success.

static json handle_create_directory(const json &arguments) {
    std::string directory_path = arguments["directory_path"].get<std::string>();
    return result_envelope::encode(file_ops::create_directory(directory_path));
}

namespace tool_create_directory {

void register_tool(mcp_tools::ToolRegistry &registry) {
    registry.register_tool({
        "create_directory",
        "Create a new directory, including any missing parent directories. "
        "Returns success, and error (message if unsuccessful).",
        {
            {"directory_path", mcp_tools::ParameterType::String, "Path of directory to create", true, std::nullopt}
        },
        handle_create_directory
    });
}

} // namespace tool_create_directory
