#pragma once
#include <cstdint>
#include <string_view>

namespace fwunpack {

struct ProgressEvent {
    std::string_view region;
    std::uint64_t region_done = 0;
    std::uint64_t region_total = 0;

    std::uint64_t overall_done = 0;
    std::uint64_t overall_total = 0;
};

class IProgress {
  public:
    virtual ~IProgress() = default;
    virtual void OnProgress(const ProgressEvent& e) = 0;
};

} // namespace fwunpack
