#include "fwunpack/partition_path_policy.hpp"

#include "util/path_utils.hpp"

#include <string_view>

namespace fwunpack {

bool PartitionPathPolicy::IsSafeRelativePath(const std::string& p) {
    if (p.empty()) return false;
    if (p.front() == '/') return false;
    if (p.find('\\') != std::string::npos) return false;

    std::string_view sv(p);
    while (!sv.empty()) {
        while (!sv.empty() && sv.front() == '/') sv.remove_prefix(1);
        const auto pos = sv.find('/');
        const auto seg = sv.substr(0, pos);
        if (seg == "..") return false;
        if (pos == std::string_view::npos) break;
        sv.remove_prefix(pos);
    }
    return true;
}

Result PartitionPathPolicy::NormalizePartitionPath(const std::string& raw_path,
                                                   std::string& out_relative) const {
    if (!safe_paths_only_) {
        out_relative = raw_path;
        return Result::Ok();
    }

    out_relative = NormalizeRelativePath(raw_path);
    if (!IsSafeRelativePath(out_relative) || out_relative.back() == '/') {
        return Result::Fail(ErrorCode::UnsafePath, "Unsafe partition path in header: '" + raw_path + "'");
    }
    return Result::Ok();
}

} // namespace fwunpack
