#include "config/server_config.hpp"
#include "utils/debug_log.hpp"

#include <cstdlib>
#include <limits>
#include <string>

namespace server_config {

static std::string read_variable(const char *name) {
    const char *value = std::getenv(name);
    if (value == nullptr) {
        return "";
    }
    return std::string(value);
}

static int read_milliseconds(const char *name, int default_value) {
    std::string text = read_variable(name);
    if (text.empty()) {
        return default_value;
    }
    int parsed_value = 0;
    if (!parse_milliseconds(text, parsed_value)) {
        debug_log::warn(std::string("Ignoring invalid ") + name + "='" + text + "', using default.");
        return default_value;
    }
    return parsed_value;
}

bool parse_milliseconds(const std::string &text, int &output_milliseconds) {
    if (text.empty() || text.size() > 10) {
        return false;
    }
    long long accumulated = 0;
    for (char character : text) {
        if (character < '0' || character > '9') {
            return false;
        }
        accumulated = accumulated * 10 + (character - '0');
    }
    if (accumulated > std::numeric_limits<int>::max()) {
        return false;
    }
    output_milliseconds = static_cast<int>(accumulated);
    return true;
}

ServerConfig load_from_environment() {
    ServerConfig config;
    config.search_api_key = read_variable(SEARCH_API_KEY_VARIABLE);
    config.search_engine_id = read_variable(SEARCH_ENGINE_ID_VARIABLE);
    config.command_timeout_milliseconds = read_milliseconds(COMMAND_TIMEOUT_VARIABLE, 0);
    config.network_timeout_milliseconds = read_milliseconds(NETWORK_TIMEOUT_VARIABLE, 0);

    std::string plan_root = read_variable(PLAN_ROOT_VARIABLE);
    if (!plan_root.empty()) {
        config.plan_root = plan_root;
    }

    if (!config.has_search_credentials()) {
        debug_log::warn(std::string(SEARCH_API_KEY_VARIABLE) + " / " + SEARCH_ENGINE_ID_VARIABLE +
                        " not set; search_web will fail until they are provided.");
    }
    debug_log::log("config: command_timeout_ms=" + std::to_string(config.command_timeout_milliseconds) +
                   " network_timeout_ms=" + std::to_string(config.network_timeout_milliseconds) +
                   " plan_root=" + config.plan_root);
    return config;
}

} // namespace server_config
