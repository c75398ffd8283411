#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "mcp/result_envelope.hpp"
#include "host/plan_document.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "create_plan".
// Overwrites project_plan/action_plan.md with a fresh header and the given content.

static json handle_create_plan(const json &arguments, const plan_document::PlanDocument &plan) {
    std::string plan_content = arguments["plan_content"].get<std::string>();
    return result_envelope::encode(plan.create(plan_content));
}

namespace tool_create_plan {

void register_tool(mcp_tools::ToolRegistry &registry, const server_config::ServerConfig &config) {
    plan_document::PlanDocument plan(config.plan_root);

    registry.register_tool({
        "create_plan",
        "Create or update the project action plan file. The plan is stored in "
        "project_plan/action_plan.md together with the working directory. "
        "Returns success, and error (message if unsuccessful).",
        {
            {"plan_content", mcp_tools::ParameterType::String, "Content to write to the plan file", true, std::nullopt}
        },
        [plan](const json &arguments) {
            return handle_create_plan(arguments, plan);
        }
    });
}

} // namespace tool_create_plan
