#include "mcp/result_envelope.hpp"
#include "utils/utf8_sanitize.hpp"

namespace result_envelope {

std::string kind_name(host_ops::ErrorKind kind) {
    switch (kind) {
    case host_ops::ErrorKind::UnknownTool:
        return "unknown_tool";
    case host_ops::ErrorKind::InvalidArguments:
        return "invalid_arguments";
    case host_ops::ErrorKind::HostExecutionFailure:
        return "host_execution_failure";
    case host_ops::ErrorKind::IOFailure:
        return "io_failure";
    case host_ops::ErrorKind::NetworkFailure:
        return "network_failure";
    }
    return "io_failure";
}

void write_payload(json &body, const host_ops::CommandOutput &payload) {
    body["stdout"] = utf8_sanitize::sanitize(payload.stdout_text);
    body["stderr"] = utf8_sanitize::sanitize(payload.stderr_text);
    body["exit_code"] = payload.exit_code;
}

void write_payload(json &body, const host_ops::FileContent &payload) {
    body["content"] = utf8_sanitize::sanitize(payload.content);
}

void write_payload(json &body, const host_ops::DirectoryListing &payload) {
    json contents = json::array();
    for (const auto &entry_name : payload.contents) {
        contents.push_back(utf8_sanitize::sanitize(entry_name));
    }
    body["contents"] = contents;
}

void write_payload(json &body, const host_ops::FileInfo &payload) {
    json info;
    info["size"] = payload.size;
    info["modified_time"] = payload.modified_time;
    info["created_time"] = payload.created_time;
    info["is_directory"] = payload.is_directory;
    info["is_file"] = payload.is_file;
    body["info"] = info;
}

void write_payload(json &body, const host_ops::SearchResults &payload) {
    body["results"] = utf8_sanitize::sanitize(payload.results);
}

void write_payload(json &body, const host_ops::Completed &payload) {
    (void)body;
    (void)payload;
}

// A failed command keeps the shape of a command result: nothing on stdout,
// the error on stderr, exit code 1.
void write_empty_payload(json &body, const host_ops::Failure &failure, PayloadTag<host_ops::CommandOutput>) {
    body["stdout"] = "";
    body["stderr"] = utf8_sanitize::sanitize(failure.message);
    body["exit_code"] = 1;
}

void write_empty_payload(json &body, const host_ops::Failure &failure, PayloadTag<host_ops::FileContent>) {
    (void)failure;
    body["content"] = "";
}

void write_empty_payload(json &body, const host_ops::Failure &failure, PayloadTag<host_ops::DirectoryListing>) {
    (void)failure;
    body["contents"] = json::array();
}

void write_empty_payload(json &body, const host_ops::Failure &failure, PayloadTag<host_ops::FileInfo>) {
    (void)failure;
    body["info"] = json::object();
}

void write_empty_payload(json &body, const host_ops::Failure &failure, PayloadTag<host_ops::SearchResults>) {
    (void)failure;
    body["results"] = "";
}

void write_empty_payload(json &body, const host_ops::Failure &failure, PayloadTag<host_ops::Completed>) {
    (void)body;
    (void)failure;
}

json encode_failure(const host_ops::Failure &failure) {
    json body = json::object();
    body["success"] = false;
    body["error"] = utf8_sanitize::sanitize(failure.message);
    body["error_kind"] = kind_name(failure.kind);
    return body;
}

bool is_success(const json &envelope) {
    return envelope.is_object() && envelope.contains("success") &&
           envelope["success"].is_boolean() && envelope["success"].get<bool>();
}

} // namespace result_envelope
