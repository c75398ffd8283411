#include "host/plan_document.hpp"
#include "host/file_ops.hpp"
#include "utils/debug_log.hpp"

#include <mutex>
#include <system_error>
#include <utility>

namespace plan_document {

static std::mutex &plan_mutex() {
    static std::mutex mutex;
    return mutex;
}

PlanDocument::PlanDocument(std::filesystem::path plan_root)
    : plan_root_(std::move(plan_root)) {}

std::filesystem::path PlanDocument::file_path() const {
    return plan_root_ / PLAN_DIRECTORY_NAME / PLAN_FILE_NAME;
}

std::string PlanDocument::build_header() const {
    std::error_code error;
    std::filesystem::path working_directory = std::filesystem::weakly_canonical(plan_root_, error);
    if (error) {
        working_directory = std::filesystem::absolute(plan_root_, error).lexically_normal();
    }
    return std::string(PLAN_TITLE) + "\n\nWorking Directory: " + working_directory.string() + "\n\n";
}

host_ops::Result<host_ops::Completed> PlanDocument::ensure_directory() const {
    return file_ops::create_directory((plan_root_ / PLAN_DIRECTORY_NAME).string());
}

host_ops::Result<host_ops::Completed> PlanDocument::create(const std::string &plan_content) const {
    std::lock_guard<std::mutex> lock(plan_mutex());

    auto directory_result = ensure_directory();
    if (!host_ops::succeeded(directory_result)) {
        return directory_result;
    }

    debug_log::log("create_plan: " + file_path().string());
    return file_ops::write_file(file_path().string(), build_header() + plan_content,
                                file_ops::WriteMode::Overwrite);
}

host_ops::Result<host_ops::Completed> PlanDocument::append(const std::string &additional_content) const {
    std::lock_guard<std::mutex> lock(plan_mutex());

    std::error_code error;
    if (!std::filesystem::exists(file_path(), error)) {
        auto directory_result = ensure_directory();
        if (!host_ops::succeeded(directory_result)) {
            return directory_result;
        }
        debug_log::log("append_plan: plan absent, writing header to " + file_path().string());
        auto header_result = file_ops::write_file(file_path().string(), build_header(),
                                                  file_ops::WriteMode::Overwrite);
        if (!host_ops::succeeded(header_result)) {
            return header_result;
        }
    }

    return file_ops::append_file(file_path().string(), "\n" + additional_content);
}

host_ops::Result<host_ops::FileContent> PlanDocument::read() const {
    std::lock_guard<std::mutex> lock(plan_mutex());
    return file_ops::read_file(file_path().string());
}

} // namespace plan_document
