#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <sys/types.h>

namespace fwunpack {

class IReader {
public:
    virtual ~IReader() = default;
    // Returns bytes read, 0 at end of input, -1 on error (errno set).
    virtual ssize_t Read(std::span<std::uint8_t> out) = 0;
    virtual std::optional<std::uint64_t> TotalSize() const { return std::nullopt; }
};

class ISeekableReader : public IReader {
public:
    // Positions the next Read() at an absolute byte offset.
    virtual Result Seek(std::uint64_t offset) = 0;
};

class IWriter {
public:
    virtual ~IWriter() = default;
    virtual Result WriteAll(std::span<const std::uint8_t> in) = 0;
};

} // namespace fwunpack
