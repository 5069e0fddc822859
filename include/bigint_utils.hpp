#pragma once
#include "lcg_config.hpp"
#include <boost/multiprecision/cpp_int.hpp>
#include <string>

using boost::multiprecision::cpp_int;

// True for an optional '-' followed by one or more decimal digits
static inline bool is_big_decimal(const std::string &s) {
    size_t i = (!s.empty() && s[0] == '-') ? 1 : 0;
    if (i == s.size()) return false;
    for (; i < s.size(); ++i) {
        if (s[i] < '0' || s[i] > '9') return false;
    }
    return true;
}

static inline cpp_int read_big_decimal(const std::string &s) {
    cpp_int N = 0;
    for (char ch : s) {
        if (ch >= '0' && ch <= '9') {
            N = N * 10 + (ch - '0');
        }
    }
    if (!s.empty() && s[0] == '-') N = -N;
    return N;
}

static inline size_t bitlen_cppint(const cpp_int &x) {
    cpp_int t = abs(x);
    size_t bits = 0;
    while (t > 0) {
        t >>= 1;
        ++bits;
    }
    return bits ? bits : 1;
}
