#include <cstdio>
#include <cstdlib>
#include <cstdint>
#include <string>
#include <random>
#include <fstream>
#include <iostream>

int main(int argc, char** argv){
  if (argc < 3){
    std::cerr << "usage: gen_numeric_data <out.txt> <count> [bad_every:0=none]\n";
    return 2;
  }
  const std::string out = argv[1];
  const std::uint64_t count = std::strtoull(argv[2], nullptr, 10);
  const std::uint64_t bad_every = argc > 3 ? std::strtoull(argv[3], nullptr, 10) : 0;

  std::ofstream f(out, std::ios::binary);
  if (!f){ std::cerr << "open failed: " << out << "\n"; return 2; }

  std::mt19937_64 rng(42);
  std::normal_distribution<double> dn(250.0, 40.0);
  std::uniform_int_distribution<int> di(0, 500);
  const char* junk[] = {"n/a","abc","1,5","--3","12e","ABA"};

  for (std::uint64_t i=1;i<=count;++i){
    if (bad_every && i % bad_every == 0){
      f << junk[i % 6] << "\n";
      continue;
    }
    // mix integers (repeats give a mode) and reals
    if (i % 4 == 0){
      f << di(rng) << "\n";
    } else {
      char buf[64];
      std::snprintf(buf, sizeof(buf), "%.3f", dn(rng));
      f << buf << "\n";
    }
  }
  std::cerr << "wrote " << count << " lines to " << out << "\n";
  return 0;
}
