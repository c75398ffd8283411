// cmcps – Coder Model Context Protocol Server
// Entry point: stdio MCP server loop, or one-shot use from a terminal.
//
//   cmcps --stdio            serve MCP over stdin/stdout (also the default when stdin
//                            is not a terminal, i.e. when an MCP client launched us)
//   cmcps --list-tools       print the tool catalog as JSON
//   cmcps                    same as --list-tools when stdin is a terminal
//   cmcps <command words>    run the words as one shell command and print the envelope
//
// Server mode reads JSON-RPC 2.0 messages from stdin, dispatches them, writes responses
// to stdout. Logs go to stderr, which MCP leaves free for logging.

#include <nlohmann/json.hpp>
#include <unistd.h>
#include <csignal>
#include <exception>
#include <iostream>
#include <string>

#include "config/server_config.hpp"
#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_stdio.hpp"
#include "mcp/mcp_tools.hpp"
#include "mcp/mcp_worker.hpp"
#include "protocol/json_rpc.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"

using json = nlohmann::json;

// Global flag for graceful shutdown.
static volatile std::sig_atomic_t shutdown_requested = 0;

static void signal_handler(int signal_number) {
    (void)signal_number;
    shutdown_requested = 1;
}

static int run_stdio_server() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    mcp_stdio::log_message("cmcps started. Waiting for MCP messages on stdin.");

    mcp_worker::InvocationTracker invocation_tracker;

    // Main message loop: read from stdin, dispatch, write to stdout.
    while (!shutdown_requested) {
        std::string raw_message = mcp_stdio::read_message();

        if (raw_message.empty()) {
            // EOF on stdin means the client disconnected.
            debug_log::log("EOF on stdin. Waiting for " + std::to_string(invocation_tracker.in_flight()) +
                           " in-flight tool call(s).");
            mcp_stdio::log_message("EOF on stdin. Shutting down.");
            break;
        }

        json parsed_message;
        std::string parse_error;
        if (!json_rpc::parse_message(raw_message, parsed_message, parse_error)) {
            mcp_stdio::log_message("Failed to parse incoming JSON: " + parse_error);
            // No request id is available.
            json error_response = json_rpc::build_error_response(nullptr, json_rpc::PARSE_ERROR, "Parse error");
            mcp_stdio::write_message(error_response.dump());
            continue;
        }

        // Tool calls may block for as long as the command or download takes; each one
        // gets its own thread and writes its own response when done.
        if (mcp_dispatch::is_tool_call(parsed_message)) {
            invocation_tracker.submit([parsed_message]() {
                json response;
                try {
                    response = mcp_dispatch::dispatch_message(parsed_message);
                } catch (const std::exception &exception) {
                    mcp_stdio::log_message(std::string("tools/call failed: ") + exception.what());
                    response = json_rpc::build_error_response(json_rpc::get_id(parsed_message),
                                                              json_rpc::INTERNAL_ERROR, exception.what());
                }
                mcp_stdio::write_message(response.dump(-1, ' ', false, json::error_handler_t::replace));
            });
            continue;
        }

        json response = mcp_dispatch::dispatch_message(parsed_message);

        // Notifications return null (no response needed).
        if (response.is_null()) {
            continue;
        }

        mcp_stdio::write_message(response.dump(-1, ' ', false, json::error_handler_t::replace));
    }

    invocation_tracker.wait_for_all();
    mcp_stdio::log_message("cmcps shut down.");
    return 0;
}

static int print_catalog() {
    std::cout << mcp_tools::build_catalog().dump(2) << std::endl;
    return 0;
}

// Join the words into one command line and run it through the execute_command tool.
static int run_command_line(int argc, char **argv) {
    std::string command;
    for (int index = 1; index < argc; index++) {
        if (!command.empty()) {
            command += " ";
        }
        command += argv[index];
    }

    json arguments;
    arguments["command"] = command;
    json envelope = mcp_tools::global_registry().invoke("execute_command", arguments);
    std::cout << envelope.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
    return 0;
}

int main(int argc, char **argv) {
    debug_log::log(std::string("cmcps – Coder MCP Server, build ") + __DATE__ + " " + __TIME__);

    server_config::ServerConfig config = server_config::load_from_environment();
    tool_handlers::register_all_tools(mcp_tools::global_registry(), config);

    if (argc > 1) {
        std::string first_argument = argv[1];
        if (first_argument == "--stdio") {
            return run_stdio_server();
        }
        if (first_argument == "--list-tools") {
            return print_catalog();
        }
        return run_command_line(argc, argv);
    }

    if (isatty(STDIN_FILENO)) {
        return print_catalog();
    }
    return run_stdio_server();
}
