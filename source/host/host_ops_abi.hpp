#ifndef CMCPS_HOST_OPS_ABI_HPP
#define CMCPS_HOST_OPS_ABI_HPP

// Host operation result types.
// Every operation in the host library returns a Result<Payload>: either the
// operation-specific payload or a Failure. This keeps the tool_handlers layer
// independent of how each operation talks to the host.

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace host_ops {

// Error taxonomy. UnknownTool and InvalidArguments are raised by the dispatcher only;
// the remaining kinds come from the host operations themselves.
enum class ErrorKind {
    UnknownTool,
    InvalidArguments,
    HostExecutionFailure,
    IOFailure,
    NetworkFailure
};

struct Failure {
    ErrorKind kind = ErrorKind::IOFailure;
    std::string message;
};

// Result of executing a shell command.
struct CommandOutput {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
};

// Result of reading a file or fetching a URL.
struct FileContent {
    std::string content;
};

// Result of listing a directory. Names only, in the order the host returned them.
struct DirectoryListing {
    std::vector<std::string> contents;
};

// Metadata of a filesystem entry. Times are epoch seconds.
struct FileInfo {
    std::uintmax_t size = 0;
    double modified_time = 0.0;
    double created_time = 0.0;
    bool is_directory = false;
    bool is_file = false;
};

// Raw JSON text returned by the web search provider.
struct SearchResults {
    std::string results;
};

// Operations that only report success or failure.
struct Completed {};

template <typename Payload>
using Result = std::variant<Payload, Failure>;

template <typename Payload>
bool succeeded(const Result<Payload> &result) {
    return std::holds_alternative<Payload>(result);
}

inline Failure make_failure(ErrorKind kind, const std::string &message) {
    Failure failure;
    failure.kind = kind;
    failure.message = message;
    return failure;
}

} // namespace host_ops

#endif // CMCPS_HOST_OPS_ABI_HPP
