#include "host/command_runner.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

namespace command_runner {

host_ops::Result<host_ops::CommandOutput> execute_command(const std::string &command,
                                                          int timeout_milliseconds) {
    debug_log::log("execute_command: " + command);
    platform::ShellCommandResult shell_result = platform::run_shell_command(command, timeout_milliseconds);

    if (!shell_result.success) {
        debug_log::log("execute_command failed: " + shell_result.error_message);
        return host_ops::make_failure(host_ops::ErrorKind::HostExecutionFailure, shell_result.error_message);
    }

    debug_log::log("execute_command exit code " + std::to_string(shell_result.exit_code));
    host_ops::CommandOutput output;
    output.stdout_text = std::move(shell_result.stdout_text);
    output.stderr_text = std::move(shell_result.stderr_text);
    output.exit_code = shell_result.exit_code;
    return output;
}

} // namespace command_runner
