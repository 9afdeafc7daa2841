#include <gtest/gtest.h>
#include <filesystem>
#include <string>
#include "app/run.hpp"
#include "test_util.hpp"

namespace fs = std::filesystem;

namespace {

qstats::AppOptions options_for(const qstats_test::temp_dir& dir, const std::string& input) {
    qstats::AppOptions opt;
    opt.input        = (dir / input).string();
    opt.results_path = (dir / "StatisticsResults.txt").string();
    opt.quiet        = true;
    return opt;
}

std::size_t count_of(const std::string& hay, const std::string& needle) {
    std::size_t n = 0;
    for (auto pos = hay.find(needle); pos != std::string::npos; pos = hay.find(needle, pos + 1)) ++n;
    return n;
}

}

TEST(Run, WritesReportAndReturnsZero) {
    qstats_test::temp_dir dir;
    qstats_test::write_file(dir / "data.txt", "3.5 foo 7 -2.1 bar\n");
    const auto opt = options_for(dir, "data.txt");

    EXPECT_EQ(qstats::run(opt), qstats::kExitOk);

    const auto text = qstats_test::read_file(opt.results_path);
    EXPECT_NE(text.find("Valid samples        : 3\n"), std::string::npos);
    EXPECT_NE(text.find("Rejected entries     : 2\n"), std::string::npos);
    EXPECT_NE(text.find("Median               : 3.5000\n"), std::string::npos);
    EXPECT_NE(text.find("no mode (every value occurs once)"), std::string::npos);
}

TEST(Run, SecondRunAppendsAndKeepsFirstBlock) {
    qstats_test::temp_dir dir;
    qstats_test::write_file(dir / "data.txt", "1\n1\n2\n3\n");
    const auto opt = options_for(dir, "data.txt");

    ASSERT_EQ(qstats::run(opt), qstats::kExitOk);
    const auto first = qstats_test::read_file(opt.results_path);

    ASSERT_EQ(qstats::run(opt), qstats::kExitOk);
    const auto both = qstats_test::read_file(opt.results_path);

    EXPECT_GT(both.size(), first.size());
    EXPECT_EQ(both.compare(0, first.size(), first), 0);
    EXPECT_EQ(count_of(both, "Run: "), 2u);
}

TEST(Run, MissingInputLeavesResultsUntouched) {
    qstats_test::temp_dir dir;
    const auto opt = options_for(dir, "does-not-exist.txt");
    const std::string history = "Run: earlier\nsomething\n\n";
    qstats_test::write_file(opt.results_path, history);

    EXPECT_EQ(qstats::run(opt), qstats::kExitFileAccess);
    EXPECT_EQ(qstats_test::read_file(opt.results_path), history);
}

TEST(Run, MissingInputDoesNotCreateResultsFile) {
    qstats_test::temp_dir dir;
    const auto opt = options_for(dir, "does-not-exist.txt");

    EXPECT_EQ(qstats::run(opt), qstats::kExitFileAccess);
    EXPECT_FALSE(fs::exists(opt.results_path));
}

TEST(Run, NoValidDataStillAppendsBlock) {
    qstats_test::temp_dir dir;
    qstats_test::write_file(dir / "junk.txt", "alpha beta\ngamma\n");
    const auto opt = options_for(dir, "junk.txt");

    EXPECT_EQ(qstats::run(opt), qstats::kExitNoValidData);

    const auto text = qstats_test::read_file(opt.results_path);
    EXPECT_NE(text.find("no valid numeric data found"), std::string::npos);
    EXPECT_NE(text.find("Rejected entries     : 3\n"), std::string::npos);
    EXPECT_EQ(text.find("Mean"), std::string::npos);
}

TEST(Run, UnwritableResultsIsOutputFailure) {
    qstats_test::temp_dir dir;
    qstats_test::write_file(dir / "data.txt", "1 2 3\n");
    auto opt = options_for(dir, "data.txt");
    opt.results_path = dir.path().string();

    EXPECT_EQ(qstats::run(opt), qstats::kExitOutputWrite);
}
