#pragma once
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <string>

#include "../util/errors.hpp"

namespace qstats {

constexpr const char* kDefaultResultsFile = "StatisticsResults.txt";

// Appends `block` in one write. Creates the file if needed, never truncates.
inline void append_report_block(const std::filesystem::path& path, const std::string& block) {
    errno = 0;
    std::ofstream out(path, std::ios::binary | std::ios::app);
    if (!out) {
        const int err = errno;
        throw output_write_error("cannot open results file for append: " + path.string() +
                                 " (" + errno_reason(err) + ")");
    }

    errno = 0;
    out.write(block.data(), static_cast<std::streamsize>(block.size()));
    out.flush();
    if (!out) {
        const int err = errno;
        throw output_write_error("failed to write results file: " + path.string() +
                                 " (" + errno_reason(err) + ")");
    }
}

}
