#pragma once

#include "io/io.hpp"

#include <cstdint>
#include <span>

namespace fwunpack {

// Seekable reader over a caller-owned buffer. The buffer must outlive the reader.
class MemorySource final : public ISeekableReader {
public:
    explicit MemorySource(std::span<const std::uint8_t> data) : data_(data) {}

    std::optional<std::uint64_t> TotalSize() const override { return data_.size(); }
    ssize_t Read(std::span<std::uint8_t> out) override;
    Result Seek(std::uint64_t offset) override;

private:
    std::span<const std::uint8_t> data_;
    std::uint64_t pos_ = 0;
};

} // namespace fwunpack
