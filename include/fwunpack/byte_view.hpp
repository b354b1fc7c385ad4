#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace fwunpack {

// Bounds-checked little-endian field access at absolute offsets.
class ByteView {
  public:
    explicit ByteView(std::span<const std::uint8_t> data) : data_(data) {}

    size_t Size() const { return data_.size(); }
    bool Has(size_t offset, size_t len) const {
        return offset <= data_.size() && len <= data_.size() - offset;
    }

    std::optional<std::uint8_t> U8(size_t offset) const;
    std::optional<std::uint16_t> U16Le(size_t offset) const;
    std::optional<std::uint32_t> U32Le(size_t offset) const;
    std::optional<std::span<const std::uint8_t>> Bytes(size_t offset, size_t len) const;

  private:
    std::span<const std::uint8_t> data_;
};

// Text of a fixed-width field: bytes up to the first NUL, or the whole field
// when none is present. nullopt when those bytes are not valid UTF-8.
std::optional<std::string> DecodeFixedText(std::span<const std::uint8_t> field);

// Like DecodeFixedText, but a field with no NUL inside it is also nullopt.
std::optional<std::string> DecodeTerminatedText(std::span<const std::uint8_t> field);

bool IsValidUtf8(std::span<const std::uint8_t> bytes);

// "52 4b 41 46 (RKAF)" style rendering for diagnostics.
std::string DescribeBytes(std::span<const std::uint8_t> bytes);

} // namespace fwunpack
