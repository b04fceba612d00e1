#pragma once
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>

namespace bench {

inline std::string read_file(const std::string &path) {
  std::ifstream f(path, std::ios::binary);
  if (!f)
    throw std::runtime_error("cannot open " + path);
  return std::string(std::istreambuf_iterator<char>(f),
                     std::istreambuf_iterator<char>());
}

class Timer {
public:
  using clock = std::chrono::steady_clock;

  void start() { start_ = clock::now(); }

  double elapsed_ns() const {
    return std::chrono::duration<double, std::nano>(clock::now() - start_)
        .count();
  }

private:
  clock::time_point start_;
};

// One row of the comparison table. A zero dump time prints as "-".
struct Row {
  std::string decoder;
  size_t bytes;
  double decode_ns;
  double dump_ns;
  bool verified;

  void print() const {
    const double mb_per_s = decode_ns > 0 ? bytes * 1e3 / decode_ns : 0.0;
    std::cout << std::left << std::setw(24) << decoder << std::right
              << std::fixed << std::setprecision(1) << std::setw(12)
              << decode_ns / 1000.0 << std::setw(10) << mb_per_s;
    if (dump_ns > 0)
      std::cout << std::setw(12) << dump_ns / 1000.0;
    else
      std::cout << std::setw(12) << "-";
    std::cout << "  " << (verified ? "ok" : "MISMATCH") << "\n";
  }
};

inline void print_table_header(const std::string &file, size_t bytes,
                               size_t iterations) {
  std::cout << "\n" << file << "  (" << bytes << " bytes, " << iterations
            << " iterations)\n"
            << std::left << std::setw(24) << "decoder" << std::right
            << std::setw(12) << "decode us" << std::setw(10) << "MB/s"
            << std::setw(12) << "dump us" << "  check\n"
            << std::string(66, '-') << "\n";
}

} // namespace bench
