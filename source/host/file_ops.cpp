#include "host/file_ops.hpp"
#include "utils/debug_log.hpp"

#include <sys/stat.h>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace file_ops {

namespace {

host_ops::Failure io_failure(const std::string &reason, const std::string &path) {
    return host_ops::make_failure(host_ops::ErrorKind::IOFailure, reason + ": '" + path + "'");
}

// errno text, or fallback when the stream library left errno unset.
std::string errno_text(int saved_errno, const char *fallback) {
    if (saved_errno == 0) {
        return fallback;
    }
    return std::strerror(saved_errno);
}

double to_epoch_seconds(const struct timespec &time_value) {
    return static_cast<double>(time_value.tv_sec) + static_cast<double>(time_value.tv_nsec) / 1e9;
}

} // namespace

bool parse_write_mode(const std::string &text, WriteMode &output_mode) {
    if (text == "w" || text == "overwrite") {
        output_mode = WriteMode::Overwrite;
        return true;
    }
    if (text == "a" || text == "append") {
        output_mode = WriteMode::Append;
        return true;
    }
    return false;
}

host_ops::Result<host_ops::FileContent> read_file(const std::string &file_path) {
    std::error_code error;
    if (std::filesystem::is_directory(file_path, error)) {
        return io_failure(std::strerror(EISDIR), file_path);
    }

    errno = 0;
    std::ifstream file_stream(file_path, std::ios::in | std::ios::binary);
    if (!file_stream.is_open()) {
        return io_failure(errno_text(errno, "unable to open file"), file_path);
    }

    std::ostringstream string_stream;
    string_stream << file_stream.rdbuf();
    if (file_stream.bad()) {
        return io_failure(errno_text(errno, "read error"), file_path);
    }

    host_ops::FileContent file_content;
    file_content.content = string_stream.str();
    debug_log::log("read_file: " + file_path + " (" + std::to_string(file_content.content.size()) + " bytes)");
    return file_content;
}

host_ops::Result<host_ops::Completed> write_file(const std::string &file_path, const std::string &content,
                                                 WriteMode mode) {
    std::ios::openmode open_mode = std::ios::out | std::ios::binary;
    open_mode |= (mode == WriteMode::Append) ? std::ios::app : std::ios::trunc;

    errno = 0;
    std::ofstream file_stream(file_path, open_mode);
    if (!file_stream.is_open()) {
        return io_failure(errno_text(errno, "unable to open file for writing"), file_path);
    }

    file_stream << content;
    file_stream.flush();
    if (!file_stream) {
        return io_failure(errno_text(errno, "write error"), file_path);
    }

    debug_log::log(std::string(mode == WriteMode::Append ? "append" : "write") + ": " + file_path +
                   " (" + std::to_string(content.size()) + " bytes)");
    return host_ops::Completed{};
}

host_ops::Result<host_ops::Completed> append_file(const std::string &file_path, const std::string &content) {
    return write_file(file_path, content, WriteMode::Append);
}

host_ops::Result<host_ops::DirectoryListing> list_directory(const std::string &directory_path) {
    std::error_code error;
    std::filesystem::directory_iterator iterator(directory_path, error);
    if (error) {
        return io_failure(error.message(), directory_path);
    }

    host_ops::DirectoryListing listing;
    for (std::filesystem::directory_iterator end; iterator != end; iterator.increment(error)) {
        if (error) {
            return io_failure(error.message(), directory_path);
        }
        listing.contents.push_back(iterator->path().filename().string());
    }
    if (error) {
        return io_failure(error.message(), directory_path);
    }
    return listing;
}

host_ops::Result<host_ops::FileInfo> get_file_info(const std::string &file_path) {
    struct stat file_status;
    if (::stat(file_path.c_str(), &file_status) != 0) {
        return io_failure(std::strerror(errno), file_path);
    }

    host_ops::FileInfo info;
    info.size = static_cast<std::uintmax_t>(file_status.st_size);
    info.modified_time = to_epoch_seconds(file_status.st_mtim);
    info.created_time = to_epoch_seconds(file_status.st_ctim);
    info.is_directory = S_ISDIR(file_status.st_mode);
    info.is_file = S_ISREG(file_status.st_mode);
    return info;
}

host_ops::Result<host_ops::Completed> create_directory(const std::string &directory_path) {
    std::error_code error;
    std::filesystem::create_directories(directory_path, error);
    if (error) {
        return io_failure(error.message(), directory_path);
    }
    // create_directories reports no error for an existing non-directory on some
    // standard libraries; check the end state instead of trusting the return value.
    if (!std::filesystem::is_directory(directory_path, error)) {
        return io_failure(std::strerror(EEXIST), directory_path);
    }
    return host_ops::Completed{};
}

} // namespace file_ops
