#pragma once

#include "fwunpack/image_types.hpp"
#include "fwunpack/unpack_options.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace fwunpack {

// Raw fields of the wrapper ("RKFW") header. Offsets are absolute.
struct WrapperHeader {
    static constexpr size_t kVersionPatchOffset = 0x06; // u16
    static constexpr size_t kVersionMinorOffset = 0x08;
    static constexpr size_t kVersionMajorOffset = 0x09;
    static constexpr size_t kCodeOffset = 0x0a;
    static constexpr size_t kYearOffset = 0x0e; // u16, month..second follow
    static constexpr size_t kChipOffset = 0x15;
    static constexpr size_t kBootOffsetOffset = 0x19;
    static constexpr size_t kBootSizeOffset = 0x1d;
    static constexpr size_t kUpdateOffsetOffset = 0x21;
    static constexpr size_t kUpdateSizeOffset = 0x25;
    static constexpr size_t kMinSize = 0x29;

    std::uint8_t version_major = 0;
    std::uint8_t version_minor = 0;
    std::uint16_t version_patch = 0;
    std::uint32_t code = 0;

    std::uint16_t year = 0;
    std::uint8_t month = 0;
    std::uint8_t day = 0;
    std::uint8_t hour = 0;
    std::uint8_t minute = 0;
    std::uint8_t second = 0;

    std::uint8_t chip_code = 0;

    std::uint32_t boot_offset = 0;
    std::uint32_t boot_size = 0;
    std::uint32_t update_offset = 0;
    std::uint32_t update_size = 0;

    static Result Decode(std::span<const std::uint8_t> buf, WrapperHeader& out);

    std::string Version() const;
    // Calendar fields as UTC; ErrorCode::InvalidTimestamp when any is out of range.
    Result UnixTimestamp(std::int64_t& out) const;
};

// Family name for a chip code, or nullptr when the code is not in the table.
const char* ChipFamilyName(std::uint8_t chip_code);

class WrapperImageParser {
  public:
    WrapperImageParser() = default;
    explicit WrapperImageParser(UnpackOptions opt) : opt_(opt) {}

    // buf holds the whole image. Writes BOOT and embedded-update.img under dst_dir.
    Result Unpack(std::span<const std::uint8_t> buf, const std::string& dst_dir, WrapperInfo& out) const;

  private:
    UnpackOptions opt_{};
};

} // namespace fwunpack
