#pragma once

#include "util/result.hpp"

#include <string>

namespace fwunpack {

// Decides where a partition's recorded full path may be written below the
// destination directory.
class PartitionPathPolicy {
  public:
    explicit PartitionPathPolicy(bool safe_paths_only) : safe_paths_only_(safe_paths_only) {}

    Result NormalizePartitionPath(const std::string& raw_path, std::string& out_relative) const;

  private:
    static bool IsSafeRelativePath(const std::string& p);

    bool safe_paths_only_ = true;
};

} // namespace fwunpack
