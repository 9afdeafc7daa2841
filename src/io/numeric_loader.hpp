#pragma once
#include <cerrno>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <istream>
#include <sstream>
#include <string>
#include <vector>

#include "../types/numeric_literal.hpp"
#include "../util/errors.hpp"
#include "file_stats.hpp"

namespace qstats {

// ---------- data model ----------
struct raw_line {
    std::size_t line_no = 0;   // 1-based
    std::string text;
};

struct rejected_entry {
    std::size_t line_no = 0;
    std::string token;
};

// Finite values in input order.
using sample_set = std::vector<double>;

struct load_result {
    sample_set samples;
    std::vector<rejected_entry> rejected;

    std::size_t rejected_count() const noexcept { return rejected.size(); }
};

// Splits one line on whitespace and routes each token to samples or rejected.
inline void load_tokens(const raw_line& line, load_result& out) {
    std::istringstream iss(line.text);
    std::string tok;
    while (iss >> tok) {
        if (auto v = parse_real(tok)) out.samples.push_back(*v);
        else out.rejected.push_back(rejected_entry{ line.line_no, tok });
    }
}

inline load_result load_numeric_lines(std::istream& in) {
    load_result out;
    raw_line line;
    while (std::getline(in, line.text)) {
        ++line.line_no;
        if (line.line_no == 1 && line.text.rfind("\xEF\xBB\xBF", 0) == 0)
            line.text.erase(0, 3);
        load_tokens(line, out);
    }
    if (in.bad()) throw file_access_error("read error");
    return out;
}

inline load_result load_numeric_file(const std::filesystem::path& path) {
    const std::string problem = regular_file_problem(path);
    if (!problem.empty())
        throw file_access_error("cannot read input '" + path.string() + "': " + problem);

    errno = 0;
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        const int err = errno;
        throw file_access_error("cannot read input '" + path.string() + "': " + errno_reason(err));
    }

    try {
        return load_numeric_lines(in);
    } catch (const file_access_error& e) {
        throw file_access_error("cannot read input '" + path.string() + "': " + e.what());
    }
}

}
