#include "fwunpack/progress_sinks.hpp"

#include <cstdio>
#include <string>

namespace fwunpack {

namespace {
bool g_progress_line_active = false;

int Percent(std::uint64_t done, std::uint64_t total) {
    if (total == 0) return 0;
    const int pct = static_cast<int>((done * 100ULL) / total);
    return pct > 100 ? 100 : pct;
}
} // namespace

void ConsoleProgressSink::OnProgress(const ProgressEvent& e) {
    const int region_pct = e.region_total > 0 ? Percent(e.region_done, e.region_total) : 100;
    const int overall_pct = Percent(e.overall_done, e.overall_total);

    const std::string cur_region(e.region);
    if (cur_region != last_region_) {
        region_finished_ = false;
        last_region_ = cur_region;
    }
    if (region_finished_) return;

    if (e.overall_total > 0) {
        std::fprintf(stderr,
                     "\r[%.*s] %3d%% | total %3d%%",
                     (int)e.region.size(),
                     e.region.data(),
                     region_pct,
                     overall_pct);
    } else {
        std::fprintf(stderr,
                     "\r[%.*s] %3d%%",
                     (int)e.region.size(),
                     e.region.data(),
                     region_pct);
    }
    std::fflush(stderr);
    g_progress_line_active = true;

    if (region_pct >= 100) {
        std::fprintf(stderr, "\n");
        region_finished_ = true;
        g_progress_line_active = false;
    }
}

bool IsProgressLineActive() { return g_progress_line_active; }

void ClearProgressLine() {
    if (g_progress_line_active) {
        std::fprintf(stderr, "\n");
        g_progress_line_active = false;
    }
}

} // namespace fwunpack
