#pragma once
#include <fmt/format.h>
#include <mustache.hpp>
#include <cmath>
#include <cstddef>
#include <string>
#include <stdexcept>

#include "../stats/report.hpp"

namespace qstats {

constexpr int kDisplayDecimals = 4;
constexpr std::size_t kRuleWidth = 60;

// ---------- utils ----------
// Fixed 4-decimal display; values that round to zero print unsigned.
inline std::string format_fixed(double v) {
    if (std::fabs(v) < 0.5e-4) v = 0.0;
    return fmt::format("{:.{}f}", v, kDisplayDecimals);
}

inline std::string describe_mode(const mode_result& m) {
    switch (m.kind) {
        case mode_kind::none:
            return "no mode (every value occurs once)";
        case mode_kind::single:
            return fmt::format("{} (frequency {})", format_fixed(m.values.front()), m.frequency);
        case mode_kind::multiple: {
            std::string out;
            for (std::size_t i = 0; i < m.values.size(); ++i) {
                if (i) out += ", ";
                out += format_fixed(m.values[i]);
            }
            return fmt::format("{} (multimodal, frequency {})", out, m.frequency);
        }
    }
    return {};
}

// Section tags always share a line with text so standalone-line trimming
// never changes the layout.
inline const std::string& report_block_template() {
    static const std::string tmpl =
        "Run: {{{timestamp}}}  |  Input: {{{source}}}\n"
        "{{{rule}}}\n"
        "Valid samples        : {{valid}}\n"
        "Rejected entries     : {{rejected}}\n"
        "{{{thin_rule}}}\n"
        "{{#has_stats}}Mean                 : {{{mean}}}\n"
        "Median               : {{{median}}}\n"
        "Mode                 : {{{mode}}}\n"
        "Variance             : {{{variance}}}\n"
        "Standard deviation   : {{{stddev}}}\n"
        "{{/has_stats}}{{^has_stats}}Result               : no valid numeric data found\n"
        "{{/has_stats}}{{{thin_rule}}}\n"
        "Computation time     : {{{elapsed}}}\n"
        "\n";
    return tmpl;
}

// ---------- main ----------
/**
 * Renders one report block: timestamp line, counts, the five statistics
 * (or the no-data line), computation time, then a blank separator line.
 */
inline std::string render_report_block(const statistics_report& r) {
    kainjow::mustache::mustache m{report_block_template()};
    if (!m.is_valid()) throw std::runtime_error("Mustache template parse error: " + m.error_message());

    kainjow::mustache::data ctx;
    ctx.set("timestamp", kainjow::mustache::data(r.timestamp));
    ctx.set("source",    kainjow::mustache::data(r.source_path));
    ctx.set("rule",      kainjow::mustache::data(std::string(kRuleWidth, '=')));
    ctx.set("thin_rule", kainjow::mustache::data(std::string(kRuleWidth, '-')));
    ctx.set("valid",     kainjow::mustache::data(std::to_string(r.valid_count)));
    ctx.set("rejected",  kainjow::mustache::data(std::to_string(r.rejected_count)));
    ctx.set("has_stats", kainjow::mustache::data(r.has_statistics()));

    if (r.has_statistics()) {
        const descriptive_stats& s = *r.stats;
        ctx.set("mean",     kainjow::mustache::data(format_fixed(s.mean)));
        ctx.set("median",   kainjow::mustache::data(format_fixed(s.median)));
        ctx.set("mode",     kainjow::mustache::data(describe_mode(s.mode)));
        ctx.set("variance", kainjow::mustache::data(format_fixed(s.variance)));
        ctx.set("stddev",   kainjow::mustache::data(format_fixed(s.stddev)));
        ctx.set("elapsed",  kainjow::mustache::data(fmt::format("{:.{}f} ms", r.elapsed_ms, kDisplayDecimals)));
    } else {
        ctx.set("elapsed",  kainjow::mustache::data(std::string("n/a")));
    }

    return m.render(ctx);
}

}
