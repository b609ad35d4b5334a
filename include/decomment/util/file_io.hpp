#pragma once

#include <decomment/result.hpp>

#include <filesystem>
#include <istream>
#include <string>

namespace decomment {

namespace fs = std::filesystem;

/**
 * Read an entire file as raw bytes.
 * @return Content, NOT_FOUND if the path does not exist, IO_ERROR otherwise
 */
Result<std::string> read_file(const fs::path& path);

/**
 * Write content to a file, replacing it if it exists.
 */
Result<void> write_file(const fs::path& path, const std::string& content);

// Read a stream until EOF
std::string read_stream(std::istream& in);

/**
 * Path used when saving next to the input: "dir/name.ext" becomes
 * "dir/name_nocomments.ext".
 */
fs::path default_output_path(const fs::path& input);

}  // namespace decomment
