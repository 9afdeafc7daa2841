#pragma once
#include <filesystem>
#include <cstdint>
#include <string>
#include <system_error>

namespace qstats {

inline std::uintmax_t file_size_bytes(const std::filesystem::path& p) {
    std::error_code ec;
    auto sz = std::filesystem::file_size(p, ec);
    return ec ? 0u : static_cast<std::uintmax_t>(sz);
}

// Empty string when `p` names an existing regular file, otherwise why not.
inline std::string regular_file_problem(const std::filesystem::path& p) {
    namespace fs = std::filesystem;
    std::error_code ec;
    const auto st = fs::status(p, ec);
    if (ec && ec != std::errc::no_such_file_or_directory)
        return ec.message();
    if (!fs::exists(st)) return "no such file";
    if (fs::is_directory(st)) return "is a directory";
    if (!fs::is_regular_file(st)) return "not a regular file";
    return {};
}

}
