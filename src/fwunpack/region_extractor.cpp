#include "fwunpack/region_extractor.hpp"

#include "crypto/sha256.hpp"
#include "io/file_writer.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <optional>

namespace fwunpack {

namespace {

std::string LabelOf(const std::string& path) {
    const auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // namespace

RegionExtractor::RegionExtractor(Options opt) : opt_(opt) {
    if (opt_.chunk_size == 0) opt_.chunk_size = kDefaultChunkSize;
    buf_.resize(opt_.chunk_size);
}

void RegionExtractor::EmitProgress(const std::string& label,
                                   std::uint64_t done,
                                   std::uint64_t total) const {
    if (!opt_.progress_sink) return;
    ProgressEvent event{};
    event.region = label;
    event.region_done = done;
    event.region_total = total;
    event.overall_done = overall_done_;
    event.overall_total = opt_.overall_total_bytes;
    opt_.progress_sink->OnProgress(event);
}

Result RegionExtractor::Extract(ISeekableReader& src,
                                std::uint64_t offset,
                                std::uint64_t length,
                                const std::string& dst_path,
                                std::string* out_sha256) {
    LogInfo("%08llx-%08llx %s",
            (unsigned long long)offset,
            (unsigned long long)length,
            dst_path.c_str());

    FileWriter out;
    auto r = FileWriter::Open(dst_path, out);
    if (!r.ok) return r;

    r = src.Seek(offset);
    if (!r.ok) return r;

    std::optional<Sha256Hasher> hasher;
    if (opt_.compute_digest) hasher.emplace();

    const std::string label = LabelOf(dst_path);
    std::uint64_t remaining = length;
    std::uint64_t done = 0;
    std::uint64_t next_progress = opt_.progress_interval_bytes;

    while (remaining > 0) {
        const size_t want = static_cast<size_t>(std::min<std::uint64_t>(remaining, buf_.size()));
        const ssize_t n = src.Read(std::span<std::uint8_t>(buf_.data(), want));
        if (n < 0) {
            return Result::FailErrno(errno,
                                     "Read failed for " + dst_path + " (" + std::strerror(errno) + ")");
        }
        if (static_cast<size_t>(n) != want) {
            return Result::Fail(ErrorCode::TruncatedRegion,
                                "Insufficient length in source file for " + dst_path);
        }

        const std::span<const std::uint8_t> chunk(buf_.data(), want);
        r = out.WriteAll(chunk);
        if (!r.ok) return r;
        if (hasher) hasher->Update(chunk);

        remaining -= want;
        done += want;
        overall_done_ += want;

        if (opt_.progress_interval_bytes > 0 && done >= next_progress) {
            EmitProgress(label, done, length);
            next_progress = done + opt_.progress_interval_bytes;
        }
    }

    r = out.Close();
    if (!r.ok) return r;

    EmitProgress(label, done, length);

    if (hasher && out_sha256) {
        *out_sha256 = hasher->FinalHex();
        LogDebug("%s sha256=%s", label.c_str(), out_sha256->c_str());
    }
    return Result::Ok();
}

} // namespace fwunpack
