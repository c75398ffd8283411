#ifndef CMCPS_FILE_OPS_HPP
#define CMCPS_FILE_OPS_HPP

// Filesystem operations: read, write, list, stat, mkdir.
// None of these throw; host errors come back as IOFailure with the OS error text
// and the offending path.

#include <string>

#include "host/host_ops_abi.hpp"

namespace file_ops {

enum class WriteMode {
    Overwrite,
    Append
};

// Accepts "w" / "overwrite" and "a" / "append". Returns false for anything else.
bool parse_write_mode(const std::string &text, WriteMode &output_mode);

host_ops::Result<host_ops::FileContent> read_file(const std::string &file_path);

// Write content to file_path, creating the file if needed. The parent directory
// must already exist.
host_ops::Result<host_ops::Completed> write_file(const std::string &file_path, const std::string &content,
                                                 WriteMode mode = WriteMode::Overwrite);

host_ops::Result<host_ops::Completed> append_file(const std::string &file_path, const std::string &content);

// Entry names of directory_path (no "." or ".."), in the order the host returns them.
host_ops::Result<host_ops::DirectoryListing> list_directory(const std::string &directory_path = ".");

host_ops::Result<host_ops::FileInfo> get_file_info(const std::string &file_path);

// Create directory_path and any missing parents. An existing directory is not an error.
host_ops::Result<host_ops::Completed> create_directory(const std::string &directory_path);

} // namespace file_ops

#endif // CMCPS_FILE_OPS_HPP
