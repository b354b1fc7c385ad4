#pragma once

#include "fwunpack/progress.hpp"

#include <string>

namespace fwunpack {

class ConsoleProgressSink final : public IProgress {
public:
    ConsoleProgressSink() = default;

    void OnProgress(const ProgressEvent& e) override;

private:
    std::string last_region_;
    bool region_finished_ = false;
};

bool IsProgressLineActive();
void ClearProgressLine();

} // namespace fwunpack
