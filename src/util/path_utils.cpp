#include "util/path_utils.hpp"

#include <filesystem>
#include <system_error>

namespace fwunpack {

namespace fs = std::filesystem;

Result CreateDirectories(const std::string& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return Result::FailErrno(ec.value(), "create_directories failed: " + dir + ": " + ec.message());
    }
    return Result::Ok();
}

Result CreateParentDirectories(const std::string& file_path) {
    const fs::path parent = fs::path(file_path).parent_path();
    if (parent.empty()) return Result::Ok();
    return CreateDirectories(parent.string());
}

} // namespace fwunpack
