#include <fmt/format.h>
#include <exception>

#include "../app/run.hpp"
#include "../cli/cli_options.hpp"

int main(int argc, char** argv) {
    qstats::AppOptions opt;
    CLI::App app;
    try {
        qstats::parse_cli(app, opt, argc, argv);
    }
    catch (const CLI::ParseError& e) {
        return qstats::parse_error_exit(app, e);
    }
    catch (const std::exception& e) {
        fmt::print(stderr, "ERROR: {}\n", e.what());
        return qstats::kExitInternal;
    }

    return qstats::run(opt);
}
