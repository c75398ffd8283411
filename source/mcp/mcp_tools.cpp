#include "mcp/mcp_tools.hpp"
#include "mcp/result_envelope.hpp"
#include "host/host_ops_abi.hpp"
#include "utils/debug_log.hpp"

#include <exception>
#include <set>

namespace mcp_tools {

std::string type_name(ParameterType type) {
    switch (type) {
    case ParameterType::String:
        return "string";
    case ParameterType::Integer:
        return "integer";
    case ParameterType::Number:
        return "number";
    case ParameterType::Boolean:
        return "boolean";
    case ParameterType::Array:
        return "array";
    case ParameterType::Object:
        return "object";
    }
    return "string";
}

static bool matches_type(const json &value, ParameterType type) {
    switch (type) {
    case ParameterType::String:
        return value.is_string();
    case ParameterType::Integer:
        return value.is_number_integer();
    case ParameterType::Number:
        return value.is_number();
    case ParameterType::Boolean:
        return value.is_boolean();
    case ParameterType::Array:
        return value.is_array();
    case ParameterType::Object:
        return value.is_object();
    }
    return false;
}

json build_input_schema(const std::vector<ParameterSpec> &parameters) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["required"] = json::array();

    for (const auto &parameter : parameters) {
        json property;
        property["type"] = type_name(parameter.type);
        if (!parameter.description.empty()) {
            property["description"] = parameter.description;
        }
        if (parameter.default_value.has_value()) {
            property["default"] = *parameter.default_value;
        }
        input_schema["properties"][parameter.name] = property;

        if (parameter.required) {
            input_schema["required"].push_back(parameter.name);
        }
    }
    return input_schema;
}

bool bind_arguments(const std::vector<ParameterSpec> &parameters, const json &arguments,
                    json &bound_arguments, std::string &error_message) {
    if (!arguments.is_null() && !arguments.is_object()) {
        error_message = "arguments must be an object";
        return false;
    }

    json bound = json::object();
    std::set<std::string> declared_names;

    for (const auto &parameter : parameters) {
        declared_names.insert(parameter.name);

        bool present = arguments.is_object() && arguments.contains(parameter.name) &&
                       !arguments[parameter.name].is_null();
        if (!present) {
            if (parameter.default_value.has_value()) {
                bound[parameter.name] = *parameter.default_value;
                continue;
            }
            if (parameter.required) {
                error_message = "Missing required parameter '" + parameter.name + "' (" +
                                type_name(parameter.type) + ").";
                return false;
            }
            continue;
        }

        const json &value = arguments[parameter.name];
        if (!matches_type(value, parameter.type)) {
            error_message = "Parameter '" + parameter.name + "' must be of type " +
                            type_name(parameter.type) + ", got " + value.type_name() + ".";
            return false;
        }
        bound[parameter.name] = value;
    }

    if (arguments.is_object()) {
        for (auto iterator = arguments.begin(); iterator != arguments.end(); ++iterator) {
            if (declared_names.count(iterator.key()) == 0) {
                error_message = "Unexpected parameter '" + iterator.key() + "'.";
                return false;
            }
        }
    }

    bound_arguments = bound;
    return true;
}

// --- ToolRegistry ---

bool ToolRegistry::register_tool(const ToolDefinition &definition) {
    if (is_ready()) {
        debug_log::warn("register_tool(" + definition.name + ") after the registry became ready; ignored.");
        return false;
    }
    if (definition.name.empty() || !definition.handler) {
        debug_log::warn("register_tool: rejected a definition without a name or handler.");
        return false;
    }
    if (index_by_name_.count(definition.name) != 0) {
        debug_log::warn("register_tool: duplicate tool name '" + definition.name + "'.");
        return false;
    }

    std::set<std::string> parameter_names;
    for (const auto &parameter : definition.parameters) {
        if (!parameter_names.insert(parameter.name).second) {
            debug_log::warn("register_tool: duplicate parameter '" + parameter.name + "' in '" +
                            definition.name + "'.");
            return false;
        }
    }

    ToolDescriptor descriptor;
    descriptor.name = definition.name;
    descriptor.description = definition.description;
    descriptor.parameters = definition.parameters;
    descriptor.input_schema = build_input_schema(definition.parameters);

    index_by_name_[definition.name] = descriptors_.size();
    descriptors_.push_back(descriptor);
    handlers_.push_back(definition.handler);
    debug_log::log("Registered tool: " + definition.name);
    return true;
}

void ToolRegistry::mark_ready() {
    ready_.store(true);
}

ToolRegistry::State ToolRegistry::state() const {
    return is_ready() ? State::Ready : State::Uninitialized;
}

bool ToolRegistry::is_ready() const {
    return ready_.load();
}

const std::vector<ToolDescriptor> &ToolRegistry::list_tools() const {
    static const std::vector<ToolDescriptor> no_tools;
    if (!is_ready()) {
        return no_tools;
    }
    return descriptors_;
}

bool ToolRegistry::has_tool(const std::string &tool_name) const {
    return is_ready() && index_by_name_.count(tool_name) != 0;
}

json ToolRegistry::invoke(const std::string &tool_name, const json &arguments) const {
    auto index_iterator = index_by_name_.find(tool_name);
    if (!is_ready() || index_iterator == index_by_name_.end()) {
        debug_log::log("invoke: unknown tool '" + tool_name + "'");
        return result_envelope::encode_failure(
            host_ops::make_failure(host_ops::ErrorKind::UnknownTool, "Unknown tool: " + tool_name));
    }

    const ToolDescriptor &descriptor = descriptors_[index_iterator->second];
    json bound_arguments;
    std::string binding_error;
    if (!bind_arguments(descriptor.parameters, arguments, bound_arguments, binding_error)) {
        debug_log::log("invoke: " + tool_name + ": " + binding_error);
        return result_envelope::encode_failure(
            host_ops::make_failure(host_ops::ErrorKind::InvalidArguments, tool_name + ": " + binding_error));
    }

    debug_log::log(tool_name + " invoked");
    try {
        return handlers_[index_iterator->second](bound_arguments);
    } catch (const std::exception &exception) {
        debug_log::warn(tool_name + " raised: " + exception.what());
        return result_envelope::encode_failure(
            host_ops::make_failure(host_ops::ErrorKind::HostExecutionFailure, exception.what()));
    }
}

// --- Process-wide registry and MCP payloads ---

ToolRegistry &global_registry() {
    static ToolRegistry registry;
    return registry;
}

json build_tools_list_response(const ToolRegistry &registry) {
    json tools_array = json::array();
    for (const auto &tool : registry.list_tools()) {
        json tool_entry;
        tool_entry["name"] = tool.name;
        tool_entry["description"] = tool.description;
        tool_entry["inputSchema"] = tool.input_schema;
        tools_array.push_back(tool_entry);
    }

    json result;
    result["tools"] = tools_array;
    return result;
}

json dispatch_tool_call(const std::string &tool_name, const json &arguments, const ToolRegistry &registry) {
    json envelope = registry.invoke(tool_name, arguments);

    json text_content;
    text_content["type"] = "text";
    text_content["text"] = envelope.dump(2, ' ', false, json::error_handler_t::replace);

    json result;
    result["content"] = json::array({text_content});
    result["structuredContent"] = envelope;
    result["isError"] = !result_envelope::is_success(envelope);
    return result;
}

json build_catalog(const ToolRegistry &registry) {
    json catalog = json::array();
    for (const auto &tool : registry.list_tools()) {
        json entry;
        entry["name"] = tool.name;
        entry["description"] = tool.description;
        catalog.push_back(entry);
    }
    return catalog;
}

} // namespace mcp_tools
