#include <decomment/util/file_io.hpp>
#include <decomment/types.hpp>

#include <fstream>
#include <sstream>
#include <system_error>

namespace decomment {

Result<std::string> read_file(const fs::path& path) {
    if (path.empty()) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Empty input path");
    }

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Error(ErrorCode::NOT_FOUND, "File not found: " + path.string());
    }
    if (fs::is_directory(path, ec)) {
        return Error(ErrorCode::IO_ERROR, "Is a directory: " + path.string());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error(ErrorCode::IO_ERROR, "Could not open file: " + path.string());
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return Error(ErrorCode::IO_ERROR, "Could not read file: " + path.string());
    }
    return ss.str();
}

Result<void> write_file(const fs::path& path, const std::string& content) {
    if (path.empty()) {
        return Err(ErrorCode::INVALID_ARGUMENT, "Empty output path");
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Err(ErrorCode::IO_ERROR, "Could not open file for writing: " + path.string());
    }

    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out) {
        return Err(ErrorCode::IO_ERROR, "Could not write file: " + path.string());
    }
    return Ok();
}

std::string read_stream(std::istream& in) {
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

fs::path default_output_path(const fs::path& input) {
    fs::path result = input;
    result.replace_filename(input.stem().string() + OUTPUT_SUFFIX + input.extension().string());
    return result;
}

}  // namespace decomment
