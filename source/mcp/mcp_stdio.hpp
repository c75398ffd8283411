#ifndef CMCPS_MCP_STDIO_HPP
#define CMCPS_MCP_STDIO_HPP

// MCP stdio transport: JSON messages in on stdin, out on stdout, logs on stderr.

#include <istream>
#include <string>

namespace mcp_stdio {

// Read a single complete JSON object from input (stdin by default).
// Returns the raw JSON string, or empty string on EOF.
std::string read_message(std::istream &input);
std::string read_message();

// Write a JSON message to stdout followed by a newline. Safe to call from
// concurrent tool-call threads; each message is written whole.
void write_message(const std::string &json_string);

// Write a log message to stderr (MCP leaves stderr free for logging).
void log_message(const std::string &message);

} // namespace mcp_stdio

#endif // CMCPS_MCP_STDIO_HPP
