// Tests for the result envelope encoding: the success/failure shape every tool returns.

#include "mcp/result_envelope.hpp"
#include "utils/utf8_sanitize.hpp"
#include "test_support.hpp"

#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;
using test_support::check;

namespace test_result_envelope {

// Test: a successful command result carries stdout, stderr, exit_code and success=true.
static bool test_command_success_shape() {
    host_ops::CommandOutput output;
    output.stdout_text = "hello\n";
    output.stderr_text = "";
    output.exit_code = 7;

    json envelope = result_envelope::encode(host_ops::Result<host_ops::CommandOutput>(output));
    bool success = envelope["success"] == true && envelope["stdout"] == "hello\n" &&
                   envelope["stderr"] == "" && envelope["exit_code"] == 7 && !envelope.contains("error");
    return check(success, "Command success envelope has stdout/stderr/exit_code and no error");
}

// Test: a failed command keeps the command shape: empty stdout, message on stderr, exit 1.
static bool test_command_failure_shape() {
    host_ops::Result<host_ops::CommandOutput> result =
        host_ops::make_failure(host_ops::ErrorKind::HostExecutionFailure, "posix_spawn failed");
    json envelope = result_envelope::encode(result);
    bool success = envelope["success"] == false && envelope["stdout"] == "" &&
                   envelope["stderr"] == "posix_spawn failed" && envelope["exit_code"] == 1 &&
                   envelope["error"] == "posix_spawn failed" &&
                   envelope["error_kind"] == "host_execution_failure";
    return check(success, "Command failure envelope has stdout='', stderr=message, exit_code=1");
}

// Test: failed file info carries an empty info object, not a missing key.
static bool test_file_info_failure_shape() {
    host_ops::Result<host_ops::FileInfo> result =
        host_ops::make_failure(host_ops::ErrorKind::IOFailure, "No such file or directory: '/nope'");
    json envelope = result_envelope::encode(result);
    bool success = envelope["success"] == false && envelope.contains("info") &&
                   envelope["info"].is_object() && envelope["info"].empty() &&
                   envelope["error_kind"] == "io_failure";
    return check(success, "FileInfo failure envelope has info={}");
}

// Test: file info timestamps are plain JSON numbers.
static bool test_file_info_success_numbers() {
    host_ops::FileInfo info;
    info.size = 42;
    info.modified_time = 1700000000.25;
    info.created_time = 1700000000.5;
    info.is_file = true;
    json envelope = result_envelope::encode(host_ops::Result<host_ops::FileInfo>(info));
    bool success = envelope["success"] == true && envelope["info"]["size"] == 42 &&
                   envelope["info"]["modified_time"].is_number_float() &&
                   envelope["info"]["created_time"].is_number_float() &&
                   envelope["info"]["is_file"] == true && envelope["info"]["is_directory"] == false;
    return check(success, "FileInfo success envelope serializes timestamps as numbers");
}

// Test: listing failure has an empty contents array.
static bool test_listing_failure_shape() {
    host_ops::Result<host_ops::DirectoryListing> result =
        host_ops::make_failure(host_ops::ErrorKind::IOFailure, "not found");
    json envelope = result_envelope::encode(result);
    bool success = envelope["contents"].is_array() && envelope["contents"].empty() &&
                   envelope["success"] == false;
    return check(success, "Listing failure envelope has contents=[]");
}

// Test: success-only results carry nothing but the flag.
static bool test_completed_shape() {
    json envelope = result_envelope::encode(host_ops::Result<host_ops::Completed>(host_ops::Completed{}));
    bool success = envelope.size() == 1 && envelope["success"] == true;
    return check(success, "Completed envelope is exactly {success: true}");
}

// Test: invalid UTF-8 in command output does not make the envelope unserializable.
static bool test_invalid_utf8_is_sanitized() {
    host_ops::CommandOutput output;
    output.stdout_text = std::string("ok \xff\xfe end");
    json envelope = result_envelope::encode(host_ops::Result<host_ops::CommandOutput>(output));
    std::string serialized = envelope.dump();
    std::string stdout_text = envelope["stdout"].get<std::string>();
    bool success = stdout_text.find("\xEF\xBF\xBD") != std::string::npos &&
                   stdout_text.find("ok ") == 0 && !serialized.empty();
    return check(success, "Invalid UTF-8 is replaced with U+FFFD before serialization");
}

// Test: sequences with well-formed continuation bytes but forbidden values are replaced too.
static bool test_ill_formed_sequences_are_sanitized() {
    const std::string ill_formed[] = {
        std::string("\xED\xA0\x80"),         // UTF-16 surrogate U+D800
        std::string("\xE0\x80\xAF"),         // overlong '/'
        std::string("\xF0\x80\x80\xAF"),     // overlong 4-byte form
        std::string("\xF4\x90\x80\x80")      // above U+10FFFF
    };

    bool success = true;
    for (const auto &sequence : ill_formed) {
        success &= !utf8_sanitize::is_valid(sequence);
        host_ops::FileContent content;
        content.content = "ok " + sequence + " end";
        json envelope = result_envelope::encode(host_ops::Result<host_ops::FileContent>(content));
        std::string text = envelope["content"].get<std::string>();
        success &= utf8_sanitize::is_valid(text) && text.find("ok ") == 0 &&
                   text.find("\xEF\xBF\xBD") != std::string::npos && !envelope.dump().empty();
    }

    // Boundary code points just inside the well-formed ranges stay untouched.
    const std::string well_formed = "\xE0\xA0\x80 \xED\x9F\xBF \xF0\x90\x80\x80 \xF4\x8F\xBF\xBF \xE2\x82\xAC";
    success &= utf8_sanitize::is_valid(well_formed) && utf8_sanitize::sanitize(well_formed) == well_formed;
    return check(success, "Surrogates, overlong forms and out-of-range code points replaced");
}

// Test: kind names are stable wire strings.
static bool test_kind_names() {
    bool success = result_envelope::kind_name(host_ops::ErrorKind::UnknownTool) == "unknown_tool" &&
                   result_envelope::kind_name(host_ops::ErrorKind::InvalidArguments) == "invalid_arguments" &&
                   result_envelope::kind_name(host_ops::ErrorKind::NetworkFailure) == "network_failure";
    return check(success, "Error kind wire names");
}

// Test: is_success only accepts a boolean true flag.
static bool test_is_success() {
    bool success = result_envelope::is_success(json{{"success", true}}) &&
                   !result_envelope::is_success(json{{"success", false}}) &&
                   !result_envelope::is_success(json{{"success", "true"}}) &&
                   !result_envelope::is_success(json::array());
    return check(success, "is_success requires a boolean true flag on an object");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_command_success_shape();
    all_passed &= test_command_failure_shape();
    all_passed &= test_file_info_failure_shape();
    all_passed &= test_file_info_success_numbers();
    all_passed &= test_listing_failure_shape();
    all_passed &= test_completed_shape();
    all_passed &= test_invalid_utf8_is_sanitized();
    all_passed &= test_ill_formed_sequences_are_sanitized();
    all_passed &= test_kind_names();
    all_passed &= test_is_success();
    return all_passed;
}

} // namespace test_result_envelope
