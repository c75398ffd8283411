#include "utils/debug_log.hpp"

#include <cstdlib>
#include <cctype>
#include <iostream>
#include <algorithm>
#include <mutex>
#include <string>

namespace debug_log {

static std::mutex stderr_mutex;

static std::string to_lower(const std::string &input) {
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return result;
}

static bool read_debug_flag() {
    const char *value = std::getenv("CMCPS_DEBUG");
    if (value == nullptr || value[0] == '\0') {
        return false;
    }
    std::string normalized = to_lower(std::string(value));
    return (normalized == "1" || normalized == "true" || normalized == "yes");
}

bool is_debug_enabled() {
    // The environment is read once; tool calls run concurrently and getenv is not
    // guaranteed safe against a concurrent setenv.
    static const bool enabled = read_debug_flag();
    return enabled;
}

void write_line(const std::string &message) {
    std::lock_guard<std::mutex> lock(stderr_mutex);
    std::cerr << "[cmcps] " << message << std::endl;
}

void log(const std::string &message) {
    if (!is_debug_enabled()) {
        return;
    }
    write_line(message);
}

void warn(const std::string &message) {
    write_line("warning: " + message);
}

} // namespace debug_log
