#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace fwunpack {

// Read-only, seekable view of an image file on local storage.
class SourceFile final : public ISeekableReader {
public:
    static Result Open(std::string path, SourceFile& out);

    const std::string& Path() const { return path_; }

    std::optional<std::uint64_t> TotalSize() const override;
    ssize_t Read(std::span<std::uint8_t> out) override;
    Result Seek(std::uint64_t offset) override;

    // Reads from the current position to end of file.
    Result ReadToEnd(std::vector<std::uint8_t>& out);

private:
    std::string path_;
    Fd fd_;
    std::optional<std::uint64_t> size_;
};

Result ReadFileToBuffer(const std::string& path, std::vector<std::uint8_t>& out);

} // namespace fwunpack
