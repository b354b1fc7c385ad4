#include "fwunpack/partition_manifest.hpp"

#include <cerrno>
#include <cstdio>
#include <utility>

namespace fwunpack {

std::string FormatManifestLine(const PartitionInfo& part) {
    char nums[64];
    std::snprintf(nums, sizeof(nums), "0x%08x,0x%08x,0x%08x,0x%08x,0x%08x",
                  part.flash_size,
                  part.flash_offset,
                  part.part_offset,
                  part.padded_size,
                  part.part_byte_count);
    return part.name + "," + part.path + "," + nums;
}

Result PartitionManifestWriter::Open(std::string path, PartitionManifestWriter& out) {
    out.path_ = std::move(path);
    out.os_.open(out.path_, std::ios::out | std::ios::trunc);
    if (!out.os_.good()) {
        return Result::FailErrno(errno, "Failed to create manifest: " + out.path_);
    }
    return Result::Ok();
}

Result PartitionManifestWriter::Append(const PartitionInfo& part) {
    os_ << FormatManifestLine(part) << '\n';
    os_.flush();
    if (!os_.good()) {
        return Result::FailErrno(errno, "Failed to write manifest: " + path_);
    }
    return Result::Ok();
}

} // namespace fwunpack
