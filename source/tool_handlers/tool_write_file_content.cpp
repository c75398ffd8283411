#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "mcp/result_envelope.hpp"
#include "host/file_ops.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "write_file_content".
// mode selects overwrite ("w") or append ("a"); the long forms are accepted too.

static json handle_write_file_content(const json &arguments) {
    std::string file_path = arguments["file_path"].get<std::string>();
    std::string content = arguments["content"].get<std::string>();
    std::string mode_text = arguments["mode"].get<std::string>();

    file_ops::WriteMode mode = file_ops::WriteMode::Overwrite;
    if (!file_ops::parse_write_mode(mode_text, mode)) {
        return result_envelope::encode(host_ops::Result<host_ops::Completed>(
            host_ops::make_failure(host_ops::ErrorKind::InvalidArguments,
                                   "invalid mode: '" + mode_text + "' (expected 'w' or 'a')")));
    }

    return result_envelope::encode(file_ops::write_file(file_path, content, mode));
}

namespace tool_write_file_content {

void register_tool(mcp_tools::ToolRegistry &registry) {
    registry.register_tool({
        "write_file_content",
        "Write or append content to a file. Returns success, and error (message if unsuccessful).",
        {
            {"file_path", mcp_tools::ParameterType::String, "Path to the file", true, std::nullopt},
            {"content", mcp_tools::ParameterType::String, "Content to write", true, std::nullopt},
            {"mode", mcp_tools::ParameterType::String,
             "'w' for write (overwrite), 'a' for append. Defaults to 'w'", false, json("w")}
        },
        handle_write_file_content
    });
}

} // namespace tool_write_file_content
