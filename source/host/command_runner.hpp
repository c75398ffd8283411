#ifndef CMCPS_COMMAND_RUNNER_HPP
#define CMCPS_COMMAND_RUNNER_HPP

// Shell command execution for the execute_command tool.

#include <string>

#include "host/host_ops_abi.hpp"

namespace command_runner {

// Run command through /bin/sh in the server's working directory.
// Succeeds whenever the host ran the command to completion; the command's own exit
// status is reported in CommandOutput::exit_code and does not turn the result into a
// Failure. timeout_milliseconds <= 0 means no timeout.
host_ops::Result<host_ops::CommandOutput> execute_command(const std::string &command,
                                                          int timeout_milliseconds = 0);

} // namespace command_runner

#endif // CMCPS_COMMAND_RUNNER_HPP
