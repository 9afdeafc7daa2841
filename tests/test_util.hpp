#pragma once
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>

namespace qstats_test {

// Scratch directory removed on scope exit.
class temp_dir {
public:
    temp_dir() {
        std::random_device rd;
        std::mt19937_64 rng(rd());
        namespace fs = std::filesystem;
        for (int attempt = 0; attempt < 16; ++attempt) {
            path_ = fs::temp_directory_path() / ("qstats-test-" + std::to_string(rng()));
            std::error_code ec;
            if (fs::create_directory(path_, ec)) return;
        }
        throw std::runtime_error("could not create temp dir");
    }
    ~temp_dir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    temp_dir(const temp_dir&) = delete;
    temp_dir& operator=(const temp_dir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

inline void write_file(const std::filesystem::path& p, const std::string& content) {
    std::ofstream f(p, std::ios::binary);
    f << content;
}

inline std::string read_file(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    std::ostringstream oss; oss << f.rdbuf();
    return oss.str();
}

}
