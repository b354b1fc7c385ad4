#include "fwunpack/image_unpacker.hpp"

#include "fwunpack/byte_view.hpp"
#include "fwunpack/package_image.hpp"
#include "fwunpack/wrapper_image.hpp"
#include "io/source_file.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <array>
#include <vector>

namespace fwunpack {

namespace {

bool HasSignature(std::span<const std::uint8_t> head, const std::array<std::uint8_t, 4>& sig) {
    return head.size() >= sig.size() && std::equal(sig.begin(), sig.end(), head.begin());
}

} // namespace

const char* ToString(ImageFormat fmt) {
    switch (fmt) {
        case ImageFormat::Wrapper: return "wrapper";
        case ImageFormat::Package: return "package";
        default:                   return "unknown";
    }
}

ImageFormat DetectImageFormat(std::span<const std::uint8_t> head) {
    if (HasSignature(head, kPackageSignature)) return ImageFormat::Package;
    if (HasSignature(head, kWrapperSignature)) return ImageFormat::Wrapper;
    return ImageFormat::Unknown;
}

Result ImageUnpacker::UnpackFile(const std::string& image_path,
                                 const std::string& dst_dir,
                                 UnpackResult& out) const {
    std::vector<std::uint8_t> buffer;
    auto r = ReadFileToBuffer(image_path, buffer);
    if (!r.ok) return r;

    LogDebug("Read %zu bytes from %s", buffer.size(), image_path.c_str());

    switch (DetectImageFormat(buffer)) {
        case ImageFormat::Package: {
            PackageInfo info;
            r = PackageImageParser(opt_).Unpack(image_path, dst_dir, info);
            if (!r.ok) return r;
            out = std::move(info);
            return Result::Ok();
        }
        case ImageFormat::Wrapper: {
            WrapperInfo info;
            r = WrapperImageParser(opt_).Unpack(buffer, dst_dir, info);
            if (!r.ok) return r;
            out = std::move(info);
            return Result::Ok();
        }
        case ImageFormat::Unknown:
            break;
    }

    const auto head = std::span<const std::uint8_t>(buffer).first(std::min<size_t>(buffer.size(), 4));
    return Result::Fail(ErrorCode::UnrecognizedFormat, "Unknown signature: " + DescribeBytes(head));
}

} // namespace fwunpack
