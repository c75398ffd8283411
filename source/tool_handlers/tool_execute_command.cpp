#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "mcp/result_envelope.hpp"
#include "host/command_runner.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "execute_command".
// Runs the command through /bin/sh. The envelope's success flag says whether the
// command could be run; the command's own status is in exit_code.

static json handle_execute_command(const json &arguments, int timeout_milliseconds) {
    std::string command = arguments["command"].get<std::string>();
    return result_envelope::encode(command_runner::execute_command(command, timeout_milliseconds));
}

namespace tool_execute_command {

void register_tool(mcp_tools::ToolRegistry &registry, const server_config::ServerConfig &config) {
    int timeout_milliseconds = config.command_timeout_milliseconds;

    registry.register_tool({
        "execute_command",
        "Execute a shell command and return the output and exit code. "
        "Returns stdout (standard output), stderr (standard error) and exit_code "
        "(0 for success). success is false only if the command could not be run.",
        {
            {"command", mcp_tools::ParameterType::String, "The shell command to execute", true, std::nullopt}
        },
        [timeout_milliseconds](const json &arguments) {
            return handle_execute_command(arguments, timeout_milliseconds);
        }
    });
}

} // namespace tool_execute_command
