#pragma once
#include <fmt/format.h>
#include <cstdio>
#include <exception>
#include <string>

#include "../cli/cli_options.hpp"
#include "../io/numeric_loader.hpp"
#include "../report/render_report.hpp"
#include "../report/results_writer.hpp"
#include "../stats/report.hpp"
#include "../util/errors.hpp"
#include "../util/timestamp.hpp"

namespace qstats {

enum exit_code : int {
    kExitOk           = 0,
    kExitUsage        = 1,
    kExitFileAccess   = 2,
    kExitOutputWrite  = 3,
    kExitInternal     = 4,
    kExitNoValidData  = 5,   // block still appended
};

// Prints the CLI11 message; help/version stay 0, anything else is usage.
inline int parse_error_exit(const CLI::App& app, const CLI::ParseError& e) {
    return app.exit(e) == 0 ? kExitOk : kExitUsage;
}

// load -> compute -> render -> append. Nothing touches the results file
// unless the input was read successfully.
inline int run(const AppOptions& opt) {
    try {
        const load_result loaded = load_numeric_file(opt.input);

        for (const auto& rej : loaded.rejected) {
            fmt::print(stderr, "WARN: line {}: '{}' is not a valid number\n", rej.line_no, rej.token);
        }
        if (loaded.samples.empty()) {
            fmt::print(stderr, "WARN: no valid numeric data found in '{}'\n", opt.input);
        }

        const statistics_report report = build_report(loaded, now_local_timestamp(), opt.input);
        const std::string block = render_report_block(report);

        append_report_block(opt.results_path, block);

        if (!opt.quiet) fmt::print("{}", block);
        fmt::print("Results appended to '{}'\n", opt.results_path);

        return report.has_statistics() ? kExitOk : kExitNoValidData;
    }
    catch (const file_access_error& e) {
        fmt::print(stderr, "ERROR: {}\n", e.what());
        return kExitFileAccess;
    }
    catch (const output_write_error& e) {
        fmt::print(stderr, "ERROR: {}\n", e.what());
        return kExitOutputWrite;
    }
    catch (const std::exception& e) {
        fmt::print(stderr, "ERROR: {}\n", e.what());
        return kExitInternal;
    }
}

}
