#ifndef CMCPS_PLATFORM_ABI_HPP
#define CMCPS_PLATFORM_ABI_HPP

// Platform abstraction interface.
// Each OS-specific implementation lives under platform/<os>/ and provides
// definitions for the functions declared here.

#include <string>

namespace platform {

// Result of running a command through the host shell.
// success is false only when the command could not be run to completion
// (spawn failure, pipe failure, timeout); a non-zero exit code is still a success.
struct ShellCommandResult {
    bool success = false;
    bool timed_out = false;
    int exit_code = 1;
    std::string stdout_text;
    std::string stderr_text;
    std::string error_message;
};

// Run command via /bin/sh -c, capturing stdout and stderr separately.
// stdin of the child is /dev/null so it never consumes the server's input stream.
// timeout_milliseconds <= 0 waits for the command indefinitely.
ShellCommandResult run_shell_command(const std::string &command, int timeout_milliseconds);

// Kill a process by its process ID.
bool kill_process(int process_id);

} // namespace platform

#endif // CMCPS_PLATFORM_ABI_HPP
