#include "mcp/mcp_dispatch.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"

#include <string>

// MCP JSON-RPC method dispatch.
// Routes incoming MCP messages to the appropriate handler.

namespace mcp_dispatch {

// Description so that MCP clients can tell when this server is the right one to use.
static const std::string SERVER_DESCRIPTION =
    "Coder MCP server: performs actions on the host machine. Use this server when you "
    "need to run shell commands, read or write files, inspect directories, search the "
    "web, fetch URLs, or keep a persistent project action plan. Tools include "
    "execute_command, read_file_content, write_file_content, list_directory, "
    "search_web, fetch_url, create_plan, append_plan and read_plan.";

// Handle the "initialize" request.
static json handle_initialize(const json &request_id, const json &params) {
    (void)params; // We accept any client capabilities.

    json capabilities;
    capabilities["tools"] = json::object(); // We expose tools.

    json server_info;
    server_info["name"] = SERVER_NAME;
    server_info["version"] = SERVER_VERSION;
    server_info["description"] = SERVER_DESCRIPTION;

    json result;
    result["protocolVersion"] = PROTOCOL_VERSION;
    result["capabilities"] = capabilities;
    result["serverInfo"] = server_info;

    return json_rpc::build_response(request_id, result);
}

// Handle the "tools/list" request.
static json handle_tools_list(const json &request_id, const mcp_tools::ToolRegistry &registry) {
    json result = mcp_tools::build_tools_list_response(registry);
    return json_rpc::build_response(request_id, result);
}

// Handle the "tools/call" request.
static json handle_tools_call(const json &request_id, const json &params,
                              const mcp_tools::ToolRegistry &registry) {
    std::string tool_name;
    if (params.contains("name") && params["name"].is_string()) {
        tool_name = params["name"].get<std::string>();
    } else {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                               "Missing or invalid 'name' in tools/call");
    }

    json arguments = json::object();
    if (params.contains("arguments") && params["arguments"].is_object()) {
        arguments = params["arguments"];
    }

    json tool_result = mcp_tools::dispatch_tool_call(tool_name, arguments, registry);
    return json_rpc::build_response(request_id, tool_result);
}

json dispatch_message(const json &message, const mcp_tools::ToolRegistry &registry) {
    std::string method = json_rpc::get_method(message);
    json request_id = json_rpc::get_id(message);
    json params = json_rpc::get_params(message);

    // Handle notifications (no response expected).
    if (json_rpc::is_notification(message)) {
        // "notifications/initialized" and "notifications/cancelled" are acknowledged silently.
        debug_log::log("notification: " + method);
        return nullptr;
    }

    if (method.empty()) {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_REQUEST,
                                               "Missing 'method' in request");
    }

    // Route to the appropriate handler.
    if (method == "initialize") {
        return handle_initialize(request_id, params);
    }
    if (method == "ping") {
        return json_rpc::build_response(request_id, json::object());
    }
    if (method == "tools/list") {
        return handle_tools_list(request_id, registry);
    }
    if (method == "tools/call") {
        return handle_tools_call(request_id, params, registry);
    }

    return json_rpc::build_error_response(request_id, json_rpc::METHOD_NOT_FOUND,
                                           "Unknown method: " + method);
}

bool is_tool_call(const json &message) {
    return !json_rpc::is_notification(message) && json_rpc::get_method(message) == "tools/call";
}

} // namespace mcp_dispatch
