#include "metrics/timers.hpp"
#include "io/file_stats.hpp"
#include "io/numeric_loader.hpp"
#include "stats/calculator.hpp"
#include <fmt/format.h>
#include <exception>
#include <string>
#include <string_view>

using std::string;

int main(int argc, char** argv){
  // Supported:
  //   --data <file> | --data=<file>
  //   --repeat <N>  | --repeat=<N>   (compute passes over the loaded set)
  // Fallback positional: <input.txt> [repeat]
  string dataPath;
  size_t repeat = 1;

  try {
    for (int i=1;i<argc;++i){
      std::string_view a(argv[i]);
      if (a.rfind("--data=",0)==0) {
        dataPath = string(a.substr(7));
      } else if (a == "--data") {
        if (i+1>=argc){ fmt::print(stderr, "missing value for --data\n"); return 2; }
        dataPath = argv[++i];
      } else if (a.rfind("--repeat=",0)==0) {
        repeat = static_cast<size_t>(std::stoull(string(a.substr(9))));
      } else if (a == "--repeat") {
        if (i+1>=argc){ fmt::print(stderr, "missing value for --repeat\n"); return 2; }
        repeat = static_cast<size_t>(std::stoull(argv[++i]));
      } else if (dataPath.empty() && !a.empty() && a[0] != '-') {
        dataPath = string(a);
        if (i+1<argc && argv[i+1][0] != '-') repeat = static_cast<size_t>(std::stoull(argv[++i]));
      }
    }

    if (dataPath.empty()){
      fmt::print(stderr,
        "usage:\n"
        "  qstats_bench <input.txt> [repeat]\n"
        "  qstats_bench --data <input.txt> [--repeat N]\n");
      return 2;
    }
    if (repeat == 0) repeat = 1;

    const auto bytes = qstats::file_size_bytes(dataPath);

    qstats::WallTimer wt_load; wt_load.start();
    const auto loaded = qstats::load_numeric_file(dataPath);
    wt_load.stop();

    if (loaded.samples.empty()){
      fmt::print(stderr, "no valid numeric data in: {}\n", dataPath);
      return 2;
    }

    qstats::WallTimer wt_calc; wt_calc.start();
    double sink = 0.0;
    for (size_t r=0;r<repeat;++r){
      const auto s = qstats::compute_statistics(loaded.samples);
      sink += s.stddev;
    }
    wt_calc.stop();

    const double load_s = wt_load.seconds();
    const double mb     = double(bytes)/(1024.0*1024.0);
    const double mbps   = load_s>0? (mb/load_s) : 0.0;
    const double calc_ms = wt_calc.ms()/double(repeat);

    fmt::print("bench_statistics,file={},samples={},rejected={},bytes={},load_sec={:.3f},MB/s={:.2f},compute_ms={:.3f},check={:.4f}\n",
               dataPath, loaded.samples.size(), loaded.rejected_count(), bytes, load_s, mbps, calc_ms, sink/double(repeat));
  } catch (const std::exception& e) {
    fmt::print(stderr, "ERROR: {}\n", e.what());
    return 2;
  }
  return 0;
}
