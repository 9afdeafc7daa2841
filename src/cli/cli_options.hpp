#pragma once
#include <CLI/CLI.hpp>
#include <string>

#include "../report/results_writer.hpp"

namespace qstats {

struct AppOptions {
    // Required/paths
    std::string input;
    std::string results_path = kDefaultResultsFile;   // fixed, not a flag

    // Console
    bool        quiet = false;      // skip echoing the report to stdout
};

// Binds into caller-owned `opt`, which must outlive `app`.
// Throws CLI::ParseError (incl. CallForHelp / CallForVersion); the caller
// prints it through app.exit().
inline void parse_cli(CLI::App& app, AppOptions& opt, int argc, char** argv) {
    app.description("Numeric file → descriptive statistics report");
    app.set_version_flag("--version", "0.1.0");

    app.add_option("input", opt.input, "Path to input data file (whitespace-separated numbers)")
        ->required();
    app.add_flag("-q,--quiet", opt.quiet, "Do not echo the report to stdout");

    app.parse(argc, argv);
}

}
