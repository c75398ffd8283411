#ifndef CMCPS_SERVER_CONFIG_HPP
#define CMCPS_SERVER_CONFIG_HPP

// Server configuration, read once from the process environment at startup and
// passed by value to the tool handlers.

#include <string>

namespace server_config {

// Environment variable names.
constexpr const char *SEARCH_API_KEY_VARIABLE = "GOOGLE_API_KEY";
constexpr const char *SEARCH_ENGINE_ID_VARIABLE = "GOOGLE_SEARCH_ENGINE_ID";
constexpr const char *COMMAND_TIMEOUT_VARIABLE = "CMCPS_COMMAND_TIMEOUT_MS";
constexpr const char *NETWORK_TIMEOUT_VARIABLE = "CMCPS_NETWORK_TIMEOUT_MS";
constexpr const char *PLAN_ROOT_VARIABLE = "CMCPS_PLAN_ROOT";

struct ServerConfig {
    // Web search credentials (Google Custom Search API key and engine id).
    std::string search_api_key;
    std::string search_engine_id;

    // 0 = no timeout.
    int command_timeout_milliseconds = 0;
    int network_timeout_milliseconds = 0;

    // Directory under which project_plan/action_plan.md lives.
    std::string plan_root = ".";

    bool has_search_credentials() const {
        return !search_api_key.empty() && !search_engine_id.empty();
    }
};

// Build the configuration from the current environment. Malformed values fall
// back to their defaults (a warning is logged for each).
ServerConfig load_from_environment();

// Parse a non-negative millisecond value. Returns false if text is not a valid number.
bool parse_milliseconds(const std::string &text, int &output_milliseconds);

} // namespace server_config

#endif // CMCPS_SERVER_CONFIG_HPP
