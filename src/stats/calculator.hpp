#pragma once
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace qstats {

// ---------- mode ----------
enum class mode_kind { none, single, multiple };

struct mode_result {
    mode_kind kind{mode_kind::none};
    std::vector<double> values;   // ascending; empty when kind == none
    std::size_t frequency{0};     // shared count of each modal value

    static mode_result no_mode(std::size_t freq) { return mode_result{ mode_kind::none, {}, freq }; }
    bool has_mode() const noexcept { return kind != mode_kind::none; }
};

struct descriptive_stats {
    double mean{0.0};
    double median{0.0};
    mode_result mode;
    double variance{0.0};
    double stddev{0.0};
};

namespace detail {

inline void require_non_empty(const std::vector<double>& xs, const char* what) {
    if (xs.empty()) throw std::invalid_argument(std::string(what) + ": empty sample set");
}

inline double median_of_sorted(const std::vector<double>& v) {
    const std::size_t n = v.size();
    const std::size_t mid = n / 2;
    if (n % 2 == 1) return v[mid];
    const double a = v[mid - 1], b = v[mid];
    // a <= b; pick the form that cannot overflow
    if ((a < 0.0) != (b < 0.0)) return (a + b) / 2.0;
    return a + (b - a) / 2.0;
}

inline mode_result mode_of_sorted(const std::vector<double>& v) {
    std::size_t best = 0;
    std::vector<double> modes;
    for (std::size_t i = 0; i < v.size();) {
        std::size_t j = i + 1;
        while (j < v.size() && v[j] == v[i]) ++j;
        const std::size_t run = j - i;
        if (run > best) { best = run; modes.assign(1, v[i]); }
        else if (run == best) { modes.push_back(v[i]); }
        i = j;
    }
    if (best <= 1) return mode_result::no_mode(best);
    return mode_result{ modes.size() == 1 ? mode_kind::single : mode_kind::multiple,
                        std::move(modes), best };
}

} // namespace detail

// Running mean; exact when every sample is equal. Both terms are scaled
// by 1/k before subtracting so finite inputs never overflow.
inline double mean(const std::vector<double>& xs) {
    detail::require_non_empty(xs, "mean");
    double m = 0.0;
    std::size_t k = 0;
    for (double x : xs) {
        ++k;
        const double kd = static_cast<double>(k);
        m += x / kd - m / kd;
    }
    return m;
}

inline double median(const std::vector<double>& xs) {
    detail::require_non_empty(xs, "median");
    auto v = xs;
    std::sort(v.begin(), v.end());
    return detail::median_of_sorted(v);
}

inline mode_result mode(const std::vector<double>& xs) {
    detail::require_non_empty(xs, "mode");
    auto v = xs;
    std::sort(v.begin(), v.end());
    return detail::mode_of_sorted(v);
}

// Population variance (divisor n) around a precomputed mean.
inline double variance(const std::vector<double>& xs, double mu) {
    detail::require_non_empty(xs, "variance");
    double ss = 0.0;
    for (double x : xs) {
        const double d = x - mu;
        ss += d * d;
    }
    return ss / static_cast<double>(xs.size());
}

inline double variance(const std::vector<double>& xs) { return variance(xs, mean(xs)); }

inline double standard_deviation(double var) { return std::sqrt(var); }

/**
 * Computes all five measures over one sample set.
 * The input is read only; median and mode work on a single sorted copy.
 *
 * @throws std::invalid_argument if `xs` is empty.
 */
inline descriptive_stats compute_statistics(const std::vector<double>& xs) {
    detail::require_non_empty(xs, "compute_statistics");

    descriptive_stats s;
    s.mean = mean(xs);

    auto sorted = xs;
    std::sort(sorted.begin(), sorted.end());
    s.median = detail::median_of_sorted(sorted);
    s.mode   = detail::mode_of_sorted(sorted);

    s.variance = variance(xs, s.mean);
    s.stddev   = standard_deviation(s.variance);
    return s;
}

}
