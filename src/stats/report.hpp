#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <utility>

#include "../io/numeric_loader.hpp"
#include "../metrics/timers.hpp"
#include "calculator.hpp"

namespace qstats {

// One run's result. `stats` is empty for the "no valid numeric data" variant.
struct statistics_report {
    std::string timestamp;
    std::string source_path;
    std::size_t valid_count = 0;
    std::size_t rejected_count = 0;
    std::optional<descriptive_stats> stats;
    double elapsed_ms = 0.0;     // computation only, no I/O

    bool has_statistics() const noexcept { return stats.has_value(); }
};

inline statistics_report build_report(const load_result& loaded,
                                      std::string timestamp,
                                      std::string source_path)
{
    statistics_report r;
    r.timestamp      = std::move(timestamp);
    r.source_path    = std::move(source_path);
    r.valid_count    = loaded.samples.size();
    r.rejected_count = loaded.rejected_count();

    if (loaded.samples.empty()) return r;

    WallTimer wt; wt.start();
    descriptive_stats s = compute_statistics(loaded.samples);
    wt.stop();

    r.stats = std::move(s);
    r.elapsed_ms = wt.ms();
    return r;
}

}
