#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace fwunpack {

inline constexpr std::array<std::uint8_t, 4> kPackageSignature{'R', 'K', 'A', 'F'};
inline constexpr std::array<std::uint8_t, 4> kWrapperSignature{'R', 'K', 'F', 'W'};

inline constexpr std::string_view kBootFileName = "BOOT";
inline constexpr std::string_view kEmbeddedPackageFileName = "embedded-update.img";
inline constexpr std::string_view kImageDirName = "Image";
inline constexpr std::string_view kManifestFileName = "partition-metadata.txt";
inline constexpr std::string_view kUnknownLabel = "unknown";

// Wrapper ("RKFW") image metadata.
struct WrapperInfo {
    std::string version;
    std::uint32_t code = 0;
    std::int64_t timestamp = 0; // seconds since the Unix epoch, header time taken as UTC
    std::string chip_family;
    std::uint8_t chip_code = 0;
    bool chip_recognized = false;

    std::uint32_t boot_offset = 0;
    std::uint32_t boot_size = 0;
    std::uint32_t update_offset = 0;
    std::uint32_t update_size = 0;

    // Set only when digests are requested and the region was extracted.
    std::string boot_sha256;
    std::string update_sha256;
};

struct PartitionInfo {
    std::string name;
    std::string path;
    std::uint32_t flash_size = 0;
    std::uint32_t flash_offset = 0;
    std::uint32_t part_offset = 0;
    std::uint32_t padded_size = 0;
    std::uint32_t part_byte_count = 0;

    std::string sha256;
};

// Update package ("RKAF") image metadata.
struct PackageInfo {
    std::string manufacturer;
    std::string model;
    std::string version; // header version word as major.minor.patch
    std::uint64_t filesize = 0;
    std::uint32_t declared_length = 0;
    bool length_consistent = true;
    std::vector<PartitionInfo> partitions;
};

using UnpackResult = std::variant<WrapperInfo, PackageInfo>;

} // namespace fwunpack
