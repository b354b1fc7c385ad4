#include "fwunpack/package_image.hpp"

#include "fwunpack/byte_view.hpp"
#include "fwunpack/partition_manifest.hpp"
#include "fwunpack/partition_path_policy.hpp"
#include "fwunpack/region_extractor.hpp"
#include "io/source_file.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <optional>
#include <string_view>
#include <vector>

namespace fwunpack {

namespace {

constexpr std::string_view kSelfEntry = "SELF";
constexpr std::string_view kReservedEntry = "RESERVED";

template <size_t N>
void CopyField(const ByteView& v, size_t offset, std::array<std::uint8_t, N>& out) {
    const auto bytes = *v.Bytes(offset, N);
    std::copy(bytes.begin(), bytes.end(), out.begin());
}

bool IsPlaceholder(const std::string& full_path) {
    return full_path == kSelfEntry || full_path == kReservedEntry;
}

// Reads until the buffer is full or the file ends.
Result ReadHeaderBytes(SourceFile& file, std::vector<std::uint8_t>& buf) {
    size_t got = 0;
    while (got < buf.size()) {
        const ssize_t n = file.Read(std::span<std::uint8_t>(buf.data() + got, buf.size() - got));
        if (n < 0) {
            return Result::FailErrno(errno, "Read failed in " + file.Path() + " (" +
                                                std::strerror(errno) + ")");
        }
        if (n == 0) break;
        got += static_cast<size_t>(n);
    }
    if (got != buf.size()) {
        return Result::Fail(ErrorCode::MalformedHeader,
                            "Can't read image header from " + file.Path() + " (" +
                                std::to_string(got) + " of " + std::to_string(buf.size()) +
                                " bytes)");
    }
    return Result::Ok();
}

} // namespace

Result PackageHeader::Decode(std::span<const std::uint8_t> buf, PackageHeader& out) {
    out = PackageHeader{};
    const ByteView v(buf);
    if (!v.Has(0, kSize)) {
        return Result::Fail(ErrorCode::MalformedHeader,
                            "Package header truncated: " + std::to_string(buf.size()) +
                                " bytes, need " + std::to_string(kSize));
    }

    CopyField(v, kMagicOffset, out.magic);
    out.length = *v.U32Le(kLengthOffset);
    CopyField(v, kModelOffset, out.model);
    CopyField(v, kIdOffset, out.id);
    CopyField(v, kManufacturerOffset, out.manufacturer);
    out.unknown1 = *v.U32Le(kUnknown1Offset);
    out.version = *v.U32Le(kVersionOffset);
    out.num_parts = *v.U32Le(kNumPartsOffset);

    for (size_t i = 0; i < kMaxParts; ++i) {
        const size_t base = kPartsOffset + i * PackagePartitionEntry::kSize;
        auto& e = out.parts[i];
        CopyField(v, base, e.name);
        const size_t nums = base + PackagePartitionEntry::kNameSize + PackagePartitionEntry::kFullPathSize;
        CopyField(v, base + PackagePartitionEntry::kNameSize, e.full_path);
        e.flash_size = *v.U32Le(nums);
        e.part_offset = *v.U32Le(nums + 4);
        e.flash_offset = *v.U32Le(nums + 8);
        e.padded_size = *v.U32Le(nums + 12);
        e.part_byte_count = *v.U32Le(nums + 16);
    }
    return Result::Ok();
}

bool PackageHeader::HasValidMagic() const {
    return std::equal(magic.begin(), magic.end(), kPackageSignature.begin());
}

std::string PackageHeader::Version() const {
    return std::to_string((version >> 24) & 0xFF) + "." + std::to_string((version >> 16) & 0xFF) +
           "." + std::to_string(version & 0xFFFF);
}

Result PackageImageParser::Unpack(const std::string& image_path,
                                  const std::string& dst_dir,
                                  PackageInfo& out) const {
    out = PackageInfo{};
    LogInfo("RKAF signature detected");

    SourceFile file;
    auto r = SourceFile::Open(image_path, file);
    if (!r.ok) return r;

    std::vector<std::uint8_t> raw(PackageHeader::kSize);
    r = ReadHeaderBytes(file, raw);
    if (!r.ok) return r;

    PackageHeader hdr;
    r = PackageHeader::Decode(raw, hdr);
    if (!r.ok) return r;

    if (!hdr.HasValidMagic()) {
        return Result::Fail(ErrorCode::MalformedHeader,
                            "Invalid header magic id: " + DescribeBytes(hdr.magic));
    }
    if (hdr.num_parts > PackageHeader::kMaxParts) {
        return Result::Fail(ErrorCode::MalformedHeader,
                            "Partition count " + std::to_string(hdr.num_parts) +
                                " exceeds table capacity " +
                                std::to_string(PackageHeader::kMaxParts));
    }

    out.filesize = file.TotalSize().value_or(0);
    out.declared_length = hdr.length;
    LogInfo("Filesize: %llu", (unsigned long long)out.filesize);
    if (out.filesize < 4 || out.filesize - 4 != hdr.length) {
        out.length_consistent = false;
        LogWarn("update_header.length cannot be correct, cannot check CRC "
                "(declared %u, file size %llu)",
                hdr.length, (unsigned long long)out.filesize);
    }

    out.manufacturer = DecodeTerminatedText(hdr.manufacturer).value_or(std::string(kUnknownLabel));
    out.model = DecodeTerminatedText(hdr.model).value_or(std::string(kUnknownLabel));
    out.version = hdr.Version();
    LogInfo("manufacturer: %s", out.manufacturer.c_str());
    LogInfo("model: %s", out.model.c_str());
    LogInfo("version: %s", out.version.c_str());

    // Resolve every entry before touching the destination so a bad table leaves no output.
    struct Planned {
        PartitionInfo info;
        std::string relative;
    };
    const PartitionPathPolicy path_policy(opt_.safe_paths_only);
    std::vector<Planned> planned;
    std::uint64_t total_bytes = 0;

    for (std::uint32_t i = 0; i < hdr.num_parts; ++i) {
        const auto& e = hdr.parts[i];
        if (std::find(e.full_path.begin(), e.full_path.end(), std::uint8_t{0}) == e.full_path.end()) {
            LogWarn("Skipping partition entry %u: path field is not NUL-terminated", i);
            continue;
        }
        auto full_path = DecodeTerminatedText(e.full_path);
        if (!full_path) {
            return Result::Fail(ErrorCode::MalformedHeader,
                                "Undecodable path in partition entry " + std::to_string(i));
        }
        if (IsPlaceholder(*full_path)) {
            LogDebug("Skipping %s partition entry", full_path->c_str());
            continue;
        }

        Planned p;
        p.info.name = DecodeTerminatedText(e.name).value_or(std::string());
        p.info.path = *full_path;
        p.info.flash_size = e.flash_size;
        p.info.flash_offset = e.flash_offset;
        p.info.part_offset = e.part_offset;
        p.info.padded_size = e.padded_size;
        p.info.part_byte_count = e.part_byte_count;

        r = path_policy.NormalizePartitionPath(p.info.path, p.relative);
        if (!r.ok) return r;

        total_bytes += e.part_byte_count;
        planned.push_back(std::move(p));
    }

    LogInfo("------- %s %zu partitions -------",
            opt_.dry_run ? "LISTING" : "UNPACKING", planned.size());

    if (opt_.dry_run) {
        for (auto& p : planned) {
            LogInfo("%08x-%08x %s", p.info.part_offset, p.info.part_byte_count, p.info.path.c_str());
            out.partitions.push_back(std::move(p.info));
        }
        return Result::Ok();
    }

    r = CreateDirectories(JoinPath(dst_dir, kImageDirName));
    if (!r.ok) return r;

    const std::string manifest_path = JoinPath(dst_dir, kManifestFileName);
    PartitionManifestWriter manifest;
    r = PartitionManifestWriter::Open(manifest_path, manifest);
    if (!r.ok) return r;

    RegionExtractor::Options ext_opt = opt_.extract;
    if (ext_opt.overall_total_bytes == 0) ext_opt.overall_total_bytes = total_bytes;
    RegionExtractor extractor(ext_opt);

    for (auto& p : planned) {
        r = manifest.Append(p.info);
        if (!r.ok) return r;

        const std::string dst_path = JoinPath(dst_dir, p.relative);
        r = CreateParentDirectories(dst_path);
        if (!r.ok) return r;

        out.partitions.push_back(std::move(p.info));
        auto& part = out.partitions.back();
        r = extractor.Extract(file, part.part_offset, part.part_byte_count, dst_path, &part.sha256);
        if (!r.ok) return r;
    }

    LogInfo("Partition metadata saved to: %s", manifest_path.c_str());
    return Result::Ok();
}

} // namespace fwunpack
