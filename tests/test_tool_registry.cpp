// Tests for the tool registry: registration, schema derivation, argument binding,
// lifecycle state and dispatch, mostly with small fake tools.

#include "mcp/mcp_tools.hpp"
#include "mcp/result_envelope.hpp"
#include "host/file_ops.hpp"
#include "test_support.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;
using test_support::check;
using test_support::TemporaryDirectory;

namespace test_tool_registry {

// Echoes its bound arguments back inside a success envelope.
static json echo_handler(const json &arguments) {
    json envelope;
    envelope["success"] = true;
    envelope["arguments"] = arguments;
    return envelope;
}

static mcp_tools::ToolDefinition make_echo_tool(const std::string &name) {
    return {
        name,
        "Echo the bound arguments.",
        {
            {"text", mcp_tools::ParameterType::String, "Text to echo", true, std::nullopt},
            {"count", mcp_tools::ParameterType::Integer, "Repetitions", false, json(1)},
            {"loud", mcp_tools::ParameterType::Boolean, "", false, std::nullopt}
        },
        echo_handler
    };
}

static void build_ready_registry(mcp_tools::ToolRegistry &registry) {
    registry.register_tool(make_echo_tool("echo"));
    registry.register_tool(make_echo_tool("second"));
    registry.register_tool({
        "throws",
        "Always throws.",
        {},
        [](const json &arguments) -> json {
            (void)arguments;
            throw std::runtime_error("handler exploded");
        }
    });
    registry.register_tool({
        "reports_failure",
        "Returns its own failure envelope.",
        {},
        [](const json &arguments) {
            (void)arguments;
            json envelope;
            envelope["success"] = false;
            envelope["error"] = "operation said no";
            envelope["content"] = "";
            return envelope;
        }
    });
    registry.mark_ready();
}

// Test: the derived schema lists every parameter with type, default, and only required names.
static bool test_schema_derivation() {
    json schema = mcp_tools::build_input_schema(make_echo_tool("echo").parameters);
    json expected = json::parse(R"({
        "type": "object",
        "properties": {
            "text":  {"type": "string",  "description": "Text to echo"},
            "count": {"type": "integer", "description": "Repetitions", "default": 1},
            "loud":  {"type": "boolean"}
        },
        "required": ["text"]
    })");
    return check(schema == expected, "Input schema derived from parameter list");
}

// Test: a registry is Uninitialized until mark_ready, and exposes nothing before that.
static bool test_lifecycle_states() {
    mcp_tools::ToolRegistry registry;
    bool success = registry.state() == mcp_tools::ToolRegistry::State::Uninitialized;
    registry.register_tool(make_echo_tool("echo"));
    success &= registry.list_tools().empty();
    json envelope = registry.invoke("echo", json{{"text", "hi"}});
    success &= envelope["success"] == false && envelope["error_kind"] == "unknown_tool";

    registry.mark_ready();
    success &= registry.state() == mcp_tools::ToolRegistry::State::Ready;
    success &= registry.list_tools().size() == 1;
    success &= !registry.register_tool(make_echo_tool("late"));
    success &= registry.list_tools().size() == 1;
    return check(success, "Uninitialized -> Ready, no partial catalog, no registration after Ready");
}

// Test: duplicates and malformed definitions are rejected.
static bool test_rejects_bad_definitions() {
    mcp_tools::ToolRegistry registry;
    bool success = registry.register_tool(make_echo_tool("echo"));
    success &= !registry.register_tool(make_echo_tool("echo"));
    success &= !registry.register_tool({"", "no name", {}, echo_handler});
    success &= !registry.register_tool({"no_handler", "missing handler", {}, nullptr});
    success &= !registry.register_tool({
        "twice",
        "duplicate parameter",
        {
            {"a", mcp_tools::ParameterType::String, "", true, std::nullopt},
            {"a", mcp_tools::ParameterType::String, "", true, std::nullopt}
        },
        echo_handler
    });
    registry.mark_ready();
    success &= registry.list_tools().size() == 1;
    return check(success, "Duplicate names, empty names, missing handlers, duplicate parameters rejected");
}

// Test: listing keeps registration order and is stable across calls.
static bool test_listing_order_is_stable() {
    mcp_tools::ToolRegistry registry;
    build_ready_registry(registry);

    const auto &first_listing = registry.list_tools();
    std::vector<std::string> first_names;
    for (const auto &tool : first_listing) {
        first_names.push_back(tool.name);
    }
    std::vector<std::string> second_names;
    for (const auto &tool : registry.list_tools()) {
        second_names.push_back(tool.name);
    }

    std::vector<std::string> expected = {"echo", "second", "throws", "reports_failure"};
    return check(first_names == expected && second_names == expected,
                 "list_tools returns registration order, identical on repeated calls");
}

// Test: unknown names produce an unknown_tool failure envelope, not an exception.
static bool test_unknown_tool() {
    mcp_tools::ToolRegistry registry;
    build_ready_registry(registry);
    json envelope = registry.invoke("__not_a_real_tool__", json::object());
    bool success = envelope["success"] == false && envelope["error_kind"] == "unknown_tool" &&
                   envelope["error"].get<std::string>().find("__not_a_real_tool__") != std::string::npos;
    return check(success, "Unknown tool yields unknown_tool failure envelope");
}

// Test: omitted optional parameters take their defaults; parameters without a default stay absent.
static bool test_defaults_applied() {
    mcp_tools::ToolRegistry registry;
    build_ready_registry(registry);
    json envelope = registry.invoke("echo", json{{"text", "hi"}});
    bool success = envelope["success"] == true && envelope["arguments"]["text"] == "hi" &&
                   envelope["arguments"]["count"] == 1 && !envelope["arguments"].contains("loud");

    json null_argument_envelope = registry.invoke("echo", json{{"text", "hi"}, {"count", nullptr}});
    success &= null_argument_envelope["arguments"]["count"] == 1;
    return check(success, "Declared defaults applied for omitted or null arguments");
}

// Test: binding errors are invalid_arguments failures and never reach the handler.
static bool test_binding_errors() {
    mcp_tools::ToolRegistry registry;
    build_ready_registry(registry);

    json missing = registry.invoke("echo", json::object());
    json wrong_type = registry.invoke("echo", json{{"text", 5}});
    json unexpected = registry.invoke("echo", json{{"text", "hi"}, {"colour", "red"}});
    json not_object = registry.invoke("echo", json::array({"hi"}));

    bool success = missing["error_kind"] == "invalid_arguments" &&
                   wrong_type["error_kind"] == "invalid_arguments" &&
                   unexpected["error_kind"] == "invalid_arguments" &&
                   not_object["error_kind"] == "invalid_arguments" &&
                   missing["success"] == false && !missing.contains("arguments");
    return check(success, "Missing, mistyped, unexpected and non-object arguments rejected");
}

// Test: a null arguments value is treated as an empty object.
static bool test_null_arguments() {
    mcp_tools::ToolRegistry registry;
    build_ready_registry(registry);
    json envelope = registry.invoke("throws", nullptr);
    return check(envelope["success"] == false && envelope["error_kind"] == "host_execution_failure",
                 "Null arguments bind like an empty object");
}

// Test: a throwing handler becomes a failure envelope.
static bool test_handler_exception_contained() {
    mcp_tools::ToolRegistry registry;
    build_ready_registry(registry);
    json envelope = registry.invoke("throws", json::object());
    bool success = envelope["success"] == false && envelope["error"] == "handler exploded" &&
                   envelope["error_kind"] == "host_execution_failure";
    return check(success, "Handler exception converted to a failure envelope");
}

// Test: an operation's own failure envelope is relayed unchanged.
static bool test_envelope_relayed_unchanged() {
    mcp_tools::ToolRegistry registry;
    build_ready_registry(registry);
    json envelope = registry.invoke("reports_failure", json::object());
    json expected;
    expected["success"] = false;
    expected["error"] = "operation said no";
    expected["content"] = "";
    return check(envelope == expected, "Handler envelope returned without reinterpretation");
}

// Test: tools/list payload and tools/call wrapping.
static bool test_mcp_payloads() {
    mcp_tools::ToolRegistry registry;
    build_ready_registry(registry);

    json list_response = mcp_tools::build_tools_list_response(registry);
    bool success = list_response["tools"].size() == 4 && list_response["tools"][0]["name"] == "echo" &&
                   list_response["tools"][0]["inputSchema"]["required"] == json::array({"text"});

    json call_result = mcp_tools::dispatch_tool_call("echo", json{{"text", "hi"}}, registry);
    success &= call_result["isError"] == false && call_result["structuredContent"]["success"] == true &&
               call_result["content"][0]["type"] == "text" &&
               json::parse(call_result["content"][0]["text"].get<std::string>()) == call_result["structuredContent"];

    json failed_call = mcp_tools::dispatch_tool_call("nope", json::object(), registry);
    success &= failed_call["isError"] == true;

    json catalog = mcp_tools::build_catalog(registry);
    success &= catalog.size() == 4 && catalog[1]["name"] == "second" &&
               catalog[1]["description"] == "Echo the bound arguments." && !catalog[1].contains("inputSchema");
    return check(success, "tools/list, tools/call and catalog payloads");
}

// Test: tools/call never throws on bytes nlohmann::json cannot serialize.
static bool test_dispatch_with_ill_formed_utf8() {
    TemporaryDirectory scratch("cmcps_registry");
    std::string path = scratch.file("bad.txt");
    file_ops::write_file(path, "ok \xED\xA0\x80 \xE0\x80\xAF end");

    mcp_tools::ToolRegistry registry;
    registry.register_tool({
        "read_file_content",
        "Read a file.",
        {
            {"file_path", mcp_tools::ParameterType::String, "", true, std::nullopt}
        },
        [](const json &arguments) {
            return result_envelope::encode(file_ops::read_file(arguments["file_path"].get<std::string>()));
        }
    });
    registry.register_tool({
        "raw_bytes",
        "Returns an envelope built without sanitizing.",
        {},
        [](const json &arguments) {
            (void)arguments;
            json envelope;
            envelope["success"] = true;
            envelope["content"] = std::string("raw \xED\xA0\x80");
            return envelope;
        }
    });
    registry.mark_ready();

    bool success = true;
    try {
        json read_result = mcp_tools::dispatch_tool_call("read_file_content", json{{"file_path", path}}, registry);
        success &= read_result["isError"] == false &&
                   read_result["structuredContent"]["content"].get<std::string>().find("ok ") == 0 &&
                   !read_result.dump().empty();

        json raw_result = mcp_tools::dispatch_tool_call("raw_bytes", json::object(), registry);
        success &= raw_result["isError"] == false &&
                   !raw_result["content"][0]["text"].get<std::string>().empty() &&
                   !raw_result.dump(-1, ' ', false, json::error_handler_t::replace).empty();
    } catch (const std::exception &exception) {
        success = check(false, std::string("dispatch_tool_call threw: ") + exception.what());
    }
    return check(success, "tools/call with surrogate and overlong bytes returns a result");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_schema_derivation();
    all_passed &= test_lifecycle_states();
    all_passed &= test_rejects_bad_definitions();
    all_passed &= test_listing_order_is_stable();
    all_passed &= test_unknown_tool();
    all_passed &= test_defaults_applied();
    all_passed &= test_binding_errors();
    all_passed &= test_null_arguments();
    all_passed &= test_handler_exception_contained();
    all_passed &= test_envelope_relayed_unchanged();
    all_passed &= test_mcp_payloads();
    all_passed &= test_dispatch_with_ill_formed_utf8();
    return all_passed;
}

} // namespace test_tool_registry
