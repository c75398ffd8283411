#ifndef CMCPS_PLAN_DOCUMENT_HPP
#define CMCPS_PLAN_DOCUMENT_HPP

// The project action plan: a single markdown file at
// <plan_root>/project_plan/action_plan.md that agents use as a shared scratchpad.
//
// Layout:
//   # Project Action Plan
//
//   Working Directory: <absolute plan root at creation time>
//
//   <free-form body>
//
// All PlanDocument instances in the process share one mutex, so create/append/read
// never interleave inside this server. Nothing guards against another process
// writing the same file; concurrent writers from outside remain last-writer-wins.

#include <filesystem>
#include <string>

#include "host/host_ops_abi.hpp"

namespace plan_document {

constexpr const char *PLAN_DIRECTORY_NAME = "project_plan";
constexpr const char *PLAN_FILE_NAME = "action_plan.md";
constexpr const char *PLAN_TITLE = "# Project Action Plan";

class PlanDocument {
public:
    explicit PlanDocument(std::filesystem::path plan_root = ".");

    // Replace the whole document: header (re-stamped working directory) + plan_content.
    host_ops::Result<host_ops::Completed> create(const std::string &plan_content) const;

    // Append "\n" + additional_content. Writes the header first if the document is absent.
    host_ops::Result<host_ops::Completed> append(const std::string &additional_content) const;

    // Full text of the document. A missing document is an IOFailure.
    host_ops::Result<host_ops::FileContent> read() const;

    std::filesystem::path file_path() const;

    // Header text for the current plan root.
    std::string build_header() const;

private:
    host_ops::Result<host_ops::Completed> ensure_directory() const;

    std::filesystem::path plan_root_;
};

} // namespace plan_document

#endif // CMCPS_PLAN_DOCUMENT_HPP
