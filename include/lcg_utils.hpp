#pragma once
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

#include "lcg_config.hpp"
#include "bigint_utils.hpp"

inline std::chrono::high_resolution_clock::time_point now_tp() {
  return std::chrono::high_resolution_clock::now();
}
inline double ms_since(std::chrono::high_resolution_clock::time_point t0) {
  return std::chrono::duration<double, std::milli>(
             std::chrono::high_resolution_clock::now() - t0)
      .count();
}

// Parse a non-negative count argument; false on anything but digits
// (leading space and sign included) or on overflow
inline bool parse_count(const char *s, u64 &out) {
  if (!s || *s < '0' || *s > '9') return false;
  char *endptr = nullptr;
  errno = 0;
  unsigned long long v = std::strtoull(s, &endptr, 10);
  if (errno == ERANGE || *endptr != '\0') return false;
  out = (u64)v;
  return true;
}

// One decimal value per line, blank lines and '#' comments skipped.
// Returns false if the file cannot be opened; a malformed line is
// reported through bad_line (1-based) and also returns false.
inline bool read_values_file(const std::string &path, std::vector<cpp_int> &out,
                             size_t *bad_line = nullptr) {
  if (bad_line) *bad_line = 0;
  std::ifstream fin(path);
  if (!fin) return false;
  std::string line;
  size_t lineno = 0;
  while (std::getline(fin, line)) {
    ++lineno;
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t'))
      line.pop_back();
    size_t first = line.find_first_not_of(" \t");
    if (first == std::string::npos || line[first] == '#') continue;
    line.erase(0, first);
    if (!is_big_decimal(line)) {
      if (bad_line) *bad_line = lineno;
      return false;
    }
    out.push_back(read_big_decimal(line));
  }
  return true;
}
