#ifndef CMCPS_RESULT_ENVELOPE_HPP
#define CMCPS_RESULT_ENVELOPE_HPP

// Result envelope: the uniform JSON shape every tool returns.
//
//   success: {"success": true,  <payload fields>}
//   failure: {"success": false, "error": "...", "error_kind": "...", <payload fields, empty>}
//
// Callers branch on "success" alone, whichever tool they invoked.

#include <nlohmann/json.hpp>
#include <string>
#include <variant>

#include "host/host_ops_abi.hpp"

namespace result_envelope {

using json = nlohmann::json;

// Wire name of an error kind, e.g. "unknown_tool", "io_failure".
std::string kind_name(host_ops::ErrorKind kind);

template <typename Payload>
struct PayloadTag {};

// Payload fields of a successful result.
void write_payload(json &body, const host_ops::CommandOutput &payload);
void write_payload(json &body, const host_ops::FileContent &payload);
void write_payload(json &body, const host_ops::DirectoryListing &payload);
void write_payload(json &body, const host_ops::FileInfo &payload);
void write_payload(json &body, const host_ops::SearchResults &payload);
void write_payload(json &body, const host_ops::Completed &payload);

// Payload fields of a failed result, at their empty/default values.
void write_empty_payload(json &body, const host_ops::Failure &failure, PayloadTag<host_ops::CommandOutput>);
void write_empty_payload(json &body, const host_ops::Failure &failure, PayloadTag<host_ops::FileContent>);
void write_empty_payload(json &body, const host_ops::Failure &failure, PayloadTag<host_ops::DirectoryListing>);
void write_empty_payload(json &body, const host_ops::Failure &failure, PayloadTag<host_ops::FileInfo>);
void write_empty_payload(json &body, const host_ops::Failure &failure, PayloadTag<host_ops::SearchResults>);
void write_empty_payload(json &body, const host_ops::Failure &failure, PayloadTag<host_ops::Completed>);

// Envelope for a failure that has no operation behind it (dispatcher errors).
json encode_failure(const host_ops::Failure &failure);

template <typename Payload>
json encode(const host_ops::Result<Payload> &result) {
    json body = json::object();
    if (const Payload *payload = std::get_if<Payload>(&result)) {
        body["success"] = true;
        write_payload(body, *payload);
        return body;
    }

    const host_ops::Failure &failure = std::get<host_ops::Failure>(result);
    body = encode_failure(failure);
    write_empty_payload(body, failure, PayloadTag<Payload>{});
    return body;
}

// True if envelope is an object carrying "success": true.
bool is_success(const json &envelope);

} // namespace result_envelope

#endif // CMCPS_RESULT_ENVELOPE_HPP
