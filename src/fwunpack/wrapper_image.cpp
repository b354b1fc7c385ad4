#include "fwunpack/wrapper_image.hpp"

#include "fwunpack/byte_view.hpp"
#include "fwunpack/region_extractor.hpp"
#include "io/memory_source.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <string>

namespace fwunpack {

namespace {

struct ChipEntry {
    std::uint8_t code;
    const char* family;
};

constexpr ChipEntry kChipTable[] = {
    {0x50, "RK29xx"},
    {0x60, "RK30xx"},
    {0x70, "RK31xx"},
    {0x80, "RK32xx"},
    {0x41, "RK3368"},
    {0x36, "RK3326"},
    {0x32, "RK3562"},
    {0x38, "RK3566"},
    {0x30, "PX30"},
};

void LogRegion(std::uint32_t offset, std::uint32_t size, std::string_view name) {
    const unsigned long long end =
        size ? static_cast<unsigned long long>(offset) + size - 1 : offset;
    LogInfo("%08x-%08llx %-26.*s (size: %u)",
            offset, end, (int)name.size(), name.data(), size);
}

} // namespace

const char* ChipFamilyName(std::uint8_t chip_code) {
    for (const auto& e : kChipTable) {
        if (e.code == chip_code) return e.family;
    }
    return nullptr;
}

Result WrapperHeader::Decode(std::span<const std::uint8_t> buf, WrapperHeader& out) {
    out = WrapperHeader{};
    const ByteView v(buf);
    if (!v.Has(0, kMinSize)) {
        return Result::Fail(ErrorCode::MalformedHeader,
                            "Wrapper header truncated: " + std::to_string(buf.size()) +
                                " bytes, need " + std::to_string(kMinSize));
    }

    // All reads below are within kMinSize.
    out.version_patch = *v.U16Le(kVersionPatchOffset);
    out.version_minor = *v.U8(kVersionMinorOffset);
    out.version_major = *v.U8(kVersionMajorOffset);
    out.code = *v.U32Le(kCodeOffset);

    out.year = *v.U16Le(kYearOffset);
    out.month = *v.U8(kYearOffset + 2);
    out.day = *v.U8(kYearOffset + 3);
    out.hour = *v.U8(kYearOffset + 4);
    out.minute = *v.U8(kYearOffset + 5);
    out.second = *v.U8(kYearOffset + 6);

    out.chip_code = *v.U8(kChipOffset);

    out.boot_offset = *v.U32Le(kBootOffsetOffset);
    out.boot_size = *v.U32Le(kBootSizeOffset);
    out.update_offset = *v.U32Le(kUpdateOffsetOffset);
    out.update_size = *v.U32Le(kUpdateSizeOffset);
    return Result::Ok();
}

std::string WrapperHeader::Version() const {
    return std::to_string(version_major) + "." + std::to_string(version_minor) + "." +
           std::to_string(version_patch);
}

Result WrapperHeader::UnixTimestamp(std::int64_t& out) const {
    namespace chr = std::chrono;

    char when[64];
    std::snprintf(when, sizeof(when), "%u-%02u-%02u %02u:%02u:%02u",
                  year, month, day, hour, minute, second);

    // chrono::year stops at 32767, so the date is evaluated in the matching year of
    // 2000..2399 and shifted back by whole 400-year Gregorian cycles.
    constexpr std::int64_t kDaysPer400Years = 146097;
    const int cycles = year / 400 - 5;
    const chr::year_month_day ymd{chr::year{2000 + year % 400},
                                  chr::month{month},
                                  chr::day{day}};
    if (!ymd.ok()) {
        return Result::Fail(ErrorCode::InvalidTimestamp, std::string("Invalid date: ") + when);
    }
    if (hour > 23 || minute > 59 || second > 59) {
        return Result::Fail(ErrorCode::InvalidTimestamp, std::string("Invalid time: ") + when);
    }

    const auto days = chr::sys_days{ymd}.time_since_epoch() + chr::days(cycles * kDaysPer400Years);
    const auto since_epoch = days + chr::hours{hour} + chr::minutes{minute} + chr::seconds{second};
    out = chr::duration_cast<chr::seconds>(since_epoch).count();
    return Result::Ok();
}

Result WrapperImageParser::Unpack(std::span<const std::uint8_t> buf,
                                  const std::string& dst_dir,
                                  WrapperInfo& out) const {
    out = WrapperInfo{};
    LogInfo("RKFW signature detected");

    WrapperHeader hdr;
    auto r = WrapperHeader::Decode(buf, hdr);
    if (!r.ok) return r;

    out.version = hdr.Version();
    out.code = hdr.code;
    LogInfo("version: %s", out.version.c_str());
    LogInfo("code field: 0x%08x", out.code);

    r = hdr.UnixTimestamp(out.timestamp);
    if (!r.ok) return r;
    LogInfo("date: %u-%02u-%02u %02u:%02u:%02u (Unix timestamp: %lld)",
            hdr.year, hdr.month, hdr.day, hdr.hour, hdr.minute, hdr.second,
            (long long)out.timestamp);

    out.chip_code = hdr.chip_code;
    if (const char* family = ChipFamilyName(hdr.chip_code)) {
        out.chip_family = family;
        out.chip_recognized = true;
    } else {
        out.chip_family = std::string(kUnknownLabel);
        out.chip_recognized = false;
        LogWarn("unrecognized chip code 0x%02x", hdr.chip_code);
    }
    LogInfo("family: %s", out.chip_family.c_str());

    out.boot_offset = hdr.boot_offset;
    out.boot_size = hdr.boot_size;
    out.update_offset = hdr.update_offset;
    out.update_size = hdr.update_size;

    RegionExtractor::Options ext_opt = opt_.extract;
    if (ext_opt.overall_total_bytes == 0) {
        ext_opt.overall_total_bytes = static_cast<std::uint64_t>(hdr.boot_size) + hdr.update_size;
    }
    RegionExtractor extractor(ext_opt);
    MemorySource source(buf);

    // The loader region is copied as-is; its content is not inspected.
    LogRegion(hdr.boot_offset, hdr.boot_size, kBootFileName);
    if (!opt_.dry_run) {
        r = CreateDirectories(dst_dir);
        if (!r.ok) return r;
        r = extractor.Extract(source, hdr.boot_offset, hdr.boot_size,
                              JoinPath(dst_dir, kBootFileName), &out.boot_sha256);
        if (!r.ok) return r;
    }

    const ByteView view(buf);
    const auto embedded_sig = view.Bytes(hdr.update_offset, kPackageSignature.size());
    if (!embedded_sig || !std::equal(embedded_sig->begin(), embedded_sig->end(),
                                     kPackageSignature.begin())) {
        char at[16];
        std::snprintf(at, sizeof(at), "0x%08x", hdr.update_offset);
        return Result::Fail(ErrorCode::MissingEmbeddedPackage,
                            std::string("Cannot find embedded RKAF update.img at offset ") + at);
    }

    LogRegion(hdr.update_offset, hdr.update_size, kEmbeddedPackageFileName);
    if (!opt_.dry_run) {
        r = extractor.Extract(source, hdr.update_offset, hdr.update_size,
                              JoinPath(dst_dir, kEmbeddedPackageFileName), &out.update_sha256);
        if (!r.ok) return r;
    }

    return Result::Ok();
}

} // namespace fwunpack
