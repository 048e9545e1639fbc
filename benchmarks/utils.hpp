#pragma once
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

namespace bench {

// Whole file, or an empty string when it cannot be opened. Throws on a
// failed read.
inline std::string read_file_or_empty(const char *path) {
  std::ifstream f(path, std::ios::binary | std::ios::ate);
  if (!f.is_open())
    return {};
  std::streamsize size = f.tellg();
  f.seekg(0, std::ios::beg);
  std::string buffer(static_cast<size_t>(size), '\0');
  if (!f.read(&buffer[0], size)) {
    throw std::runtime_error(std::string("Failed to read file: ") + path);
  }
  return buffer;
}

// High precision timer
class Timer {
public:
  using clock = std::chrono::high_resolution_clock;
  using time_point = clock::time_point;

  void start() { start_ = clock::now(); }

  double elapsed_ns() const {
    auto end = clock::now();
    return std::chrono::duration<double, std::nano>(end - start_).count();
  }

private:
  time_point start_;
};

// One row: full materialization vs. path-limited extraction
struct Result {
  std::string library;
  double full_time_ns;
  double path_time_ns;
  bool correctness_check;

  void print() const {
    std::cout << std::left << std::setw(20) << library
              << " | Full: " << std::right << std::setw(12) << std::fixed
              << std::setprecision(2) << (full_time_ns / 1000.0) << " us"
              << " | Path: " << std::setw(12) << (path_time_ns / 1000.0)
              << " us"
              << " | " << (correctness_check ? "PASS" : "FAIL") << "\n";
  }
};

inline void print_header(const std::string &benchmark_name) {
  std::cout << "\n=== " << benchmark_name << " ===\n";
  std::cout << std::string(80, '-') << "\n";
}

inline void print_table_header() {
  std::cout << std::left << std::setw(20) << "Library" << " | Timings\n";
  std::cout << std::string(80, '-') << "\n";
}

} // namespace bench
