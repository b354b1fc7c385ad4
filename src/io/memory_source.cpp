#include "io/memory_source.hpp"

#include <algorithm>

namespace fwunpack {

ssize_t MemorySource::Read(std::span<std::uint8_t> out) {
    if (pos_ >= data_.size()) return 0;
    const size_t n = static_cast<size_t>(
        std::min<std::uint64_t>(out.size(), data_.size() - pos_));
    std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(pos_), n, out.begin());
    pos_ += n;
    return static_cast<ssize_t>(n);
}

Result MemorySource::Seek(std::uint64_t offset) {
    // Seeking past the end is allowed; the next Read() then returns 0.
    pos_ = offset;
    return Result::Ok();
}

} // namespace fwunpack
