#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "mcp/result_envelope.hpp"
#include "host/plan_document.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "append_plan".

static json handle_append_plan(const json &arguments, const plan_document::PlanDocument &plan) {
    std::string additional_content = arguments["additional_content"].get<std::string>();
    return result_envelope::encode(plan.append(additional_content));
}

namespace tool_append_plan {

void register_tool(mcp_tools::ToolRegistry &registry, const server_config::ServerConfig &config) {
    plan_document::PlanDocument plan(config.plan_root);

    registry.register_tool({
        "append_plan",
        "Append content to the project action plan. Creates the plan (with its header) "
        "if it does not exist yet. Returns success, and error (message if unsuccessful).",
        {
            {"additional_content", mcp_tools::ParameterType::String, "Content to append to the plan", true, std::nullopt}
        },
        [plan](const json &arguments) {
            return handle_append_plan(arguments, plan);
        }
    });
}

} // namespace tool_append_plan
