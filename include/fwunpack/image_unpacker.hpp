#pragma once

#include "fwunpack/image_types.hpp"
#include "fwunpack/unpack_options.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <string>

namespace fwunpack {

enum class ImageFormat {
    Unknown,
    Wrapper,
    Package,
};

const char* ToString(ImageFormat fmt);

// Classifies an image by its first four bytes.
ImageFormat DetectImageFormat(std::span<const std::uint8_t> head);

// Entry point: recognizes the container format of an image file and hands it
// to the matching parser.
class ImageUnpacker {
  public:
    ImageUnpacker() = default;
    explicit ImageUnpacker(UnpackOptions opt) : opt_(opt) {}

    Result UnpackFile(const std::string& image_path, const std::string& dst_dir, UnpackResult& out) const;

  private:
    UnpackOptions opt_{};
};

} // namespace fwunpack
