#pragma once

#include "fwunpack/image_types.hpp"
#include "fwunpack/unpack_options.hpp"
#include "util/result.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace fwunpack {

struct PackagePartitionEntry {
    static constexpr size_t kSize = 112;
    static constexpr size_t kNameSize = 32;
    static constexpr size_t kFullPathSize = 60;

    std::array<std::uint8_t, kNameSize> name{};
    std::array<std::uint8_t, kFullPathSize> full_path{};
    // wire order
    std::uint32_t flash_size = 0;
    std::uint32_t part_offset = 0;
    std::uint32_t flash_offset = 0;
    std::uint32_t padded_size = 0;
    std::uint32_t part_byte_count = 0;
};

// Update package ("RKAF") header, a fixed 2048-byte little-endian record.
struct PackageHeader {
    static constexpr size_t kSize = 2048;
    static constexpr size_t kMaxParts = 16;

    static constexpr size_t kMagicOffset = 0x000;
    static constexpr size_t kLengthOffset = 0x004;
    static constexpr size_t kModelOffset = 0x008;
    static constexpr size_t kModelSize = 0x22;
    static constexpr size_t kIdOffset = 0x02a;
    static constexpr size_t kIdSize = 0x1e;
    static constexpr size_t kManufacturerOffset = 0x048;
    static constexpr size_t kManufacturerSize = 0x38;
    static constexpr size_t kUnknown1Offset = 0x080;
    static constexpr size_t kVersionOffset = 0x084;
    static constexpr size_t kNumPartsOffset = 0x088;
    static constexpr size_t kPartsOffset = 0x08c;

    std::array<std::uint8_t, 4> magic{};
    std::uint32_t length = 0;
    std::array<std::uint8_t, kModelSize> model{};
    std::array<std::uint8_t, kIdSize> id{};
    std::array<std::uint8_t, kManufacturerSize> manufacturer{};
    std::uint32_t unknown1 = 0;
    std::uint32_t version = 0;
    std::uint32_t num_parts = 0;
    std::array<PackagePartitionEntry, kMaxParts> parts{};

    // Structural decode only; the magic tag and num_parts are checked by the parser.
    static Result Decode(std::span<const std::uint8_t> buf, PackageHeader& out);

    bool HasValidMagic() const;
    std::string Version() const;
};

class PackageImageParser {
  public:
    PackageImageParser() = default;
    explicit PackageImageParser(UnpackOptions opt) : opt_(opt) {}

    // Streams each partition from the file at image_path to dst_dir/<full path>
    // and records it in dst_dir/partition-metadata.txt.
    Result Unpack(const std::string& image_path, const std::string& dst_dir, PackageInfo& out) const;

  private:
    UnpackOptions opt_{};
};

} // namespace fwunpack
