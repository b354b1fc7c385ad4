#pragma once

#include "fwunpack/region_extractor.hpp"

namespace fwunpack {

struct UnpackOptions {
    RegionExtractor::Options extract{};
    // Decode and validate headers only; create no directories or files.
    bool dry_run = false;
    bool safe_paths_only = true;
};

} // namespace fwunpack
