#ifndef CMCPS_MCP_TOOLS_HPP
#define CMCPS_MCP_TOOLS_HPP

// MCP tool registry: registration, listing, argument binding and dispatch of tool calls.
//
// The registry starts Uninitialized, accepts registrations, and becomes Ready once
// mark_ready() is called. Ready is permanent: no tool is added or removed afterwards,
// so listing and invocation need no locking and may run from any thread.

#include <nlohmann/json.hpp>
#include <atomic>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mcp_tools {

using json = nlohmann::json;

// JSON Schema type of a tool parameter.
enum class ParameterType {
    String,
    Integer,
    Number,
    Boolean,
    Array,
    Object
};

// One declared parameter of a tool.
struct ParameterSpec {
    std::string name;
    ParameterType type = ParameterType::String;
    std::string description;
    bool required = true;
    std::optional<json> default_value; // applied when the caller omits the argument
};

// A tool handler function: receives the bound arguments (every declared parameter
// present, defaults applied, types checked) and returns the result envelope.
using ToolHandler = std::function<json(const json &arguments)>;

// What a tool_*.cpp file hands to the registry.
struct ToolDefinition {
    std::string name;
    std::string description;
    std::vector<ParameterSpec> parameters;
    ToolHandler handler;
};

// What the registry hands out: the declared metadata plus the input schema
// derived from it at registration time.
struct ToolDescriptor {
    std::string name;
    std::string description;
    std::vector<ParameterSpec> parameters;
    json input_schema; // JSON Schema object
};

// JSON Schema type name ("string", "integer", ...).
std::string type_name(ParameterType type);

// Build {"type": "object", "properties": {...}, "required": [...]} for parameters.
json build_input_schema(const std::vector<ParameterSpec> &parameters);

// Bind arguments to parameters: applies defaults, checks required parameters and types,
// rejects keys that name no parameter. A JSON null argument counts as omitted.
// Returns false and sets error_message on mismatch.
bool bind_arguments(const std::vector<ParameterSpec> &parameters, const json &arguments,
                    json &bound_arguments, std::string &error_message);

class ToolRegistry {
public:
    enum class State {
        Uninitialized,
        Ready
    };

    // Add a tool. Rejected (returns false) once Ready, for an empty name, a name already
    // registered, a handler-less definition, or duplicate parameter names.
    bool register_tool(const ToolDefinition &definition);

    // Freeze the catalog.
    void mark_ready();

    State state() const;
    bool is_ready() const;

    // Descriptors in registration order. Empty until Ready.
    const std::vector<ToolDescriptor> &list_tools() const;

    bool has_tool(const std::string &tool_name) const;

    // Look up tool_name, bind arguments, run the handler and return its envelope unchanged.
    // Unknown names and binding errors produce failure envelopes (unknown_tool,
    // invalid_arguments); a handler that throws produces host_execution_failure.
    // Never throws.
    json invoke(const std::string &tool_name, const json &arguments) const;

private:
    std::vector<ToolDescriptor> descriptors_;
    std::vector<ToolHandler> handlers_;
    std::map<std::string, size_t> index_by_name_;
    std::atomic<bool> ready_{false};
};

// The process-wide registry used by the MCP server.
ToolRegistry &global_registry();

// Build the response payload for tools/list.
json build_tools_list_response(const ToolRegistry &registry = global_registry());

// Dispatch a tools/call request. Returns the result payload: the envelope as
// structuredContent, its pretty-printed text as content, and isError = !success.
json dispatch_tool_call(const std::string &tool_name, const json &arguments,
                        const ToolRegistry &registry = global_registry());

// [{"name": ..., "description": ...}] for every tool, for the command-line catalog.
json build_catalog(const ToolRegistry &registry = global_registry());

} // namespace mcp_tools

#endif // CMCPS_MCP_TOOLS_HPP
