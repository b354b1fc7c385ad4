#pragma once

#include "fwunpack/progress.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace fwunpack {

// Copies [offset, offset + length) of a source into a new file, chunk by chunk.
// Every chunk read must come back full; a short read is ErrorCode::TruncatedRegion.
class RegionExtractor {
  public:
    static constexpr size_t kDefaultChunkSize = 16 * 1024;

    struct Options {
        size_t chunk_size = kDefaultChunkSize;
        bool compute_digest = false;
        std::uint64_t progress_interval_bytes = 4 * 1024 * 1024ULL;
        IProgress* progress_sink = nullptr;
        std::uint64_t overall_total_bytes = 0; // 0 => unknown
    };

    RegionExtractor() : RegionExtractor(Options{}) {}
    explicit RegionExtractor(Options opt);

    // out_sha256 receives the region digest when compute_digest is set.
    Result Extract(ISeekableReader& src,
                   std::uint64_t offset,
                   std::uint64_t length,
                   const std::string& dst_path,
                   std::string* out_sha256 = nullptr);

  private:
    void EmitProgress(const std::string& label, std::uint64_t done, std::uint64_t total) const;

    Options opt_;
    std::vector<std::uint8_t> buf_;
    std::uint64_t overall_done_ = 0;
};

} // namespace fwunpack
