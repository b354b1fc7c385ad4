#pragma once

#include "fwunpack/image_types.hpp"
#include "util/result.hpp"

#include <fstream>
#include <string>

namespace fwunpack {

// name,path,0x%08x(flash_size),0x%08x(flash_offset),0x%08x(part_offset),
// 0x%08x(padded_size),0x%08x(part_byte_count)
std::string FormatManifestLine(const PartitionInfo& part);

// Appends one line per partition as partitions are discovered.
class PartitionManifestWriter {
  public:
    static Result Open(std::string path, PartitionManifestWriter& out);

    Result Append(const PartitionInfo& part);
    const std::string& Path() const { return path_; }

  private:
    std::string path_;
    std::ofstream os_;
};

} // namespace fwunpack
