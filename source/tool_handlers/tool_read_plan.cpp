#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "mcp/result_envelope.hpp"
#include "host/plan_document.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "read_plan". Takes no parameters.

namespace tool_read_plan {

void register_tool(mcp_tools::ToolRegistry &registry, const server_config::ServerConfig &config) {
    plan_document::PlanDocument plan(config.plan_root);

    registry.register_tool({
        "read_plan",
        "Read the current project action plan. Returns content (plan content if successful), "
        "success, and error (message if unsuccessful).",
        {},
        [plan](const json &arguments) {
            (void)arguments;
            return result_envelope::encode(plan.read());
        }
    });
}

} // namespace tool_read_plan
