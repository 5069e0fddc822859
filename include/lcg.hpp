#pragma once
#include "lcg_config.hpp"
#include "bigint_utils.hpp"
#include <optional>
#include <ostream>
#include <vector>

// Linear congruential generator: state' = (a * state + c) mod m
struct LCG {
    cpp_int state;
    cpp_int a;  // multiplier
    cpp_int c;  // increment
    cpp_int m;  // modulus, > 1

    // Throws std::invalid_argument when m <= 1
    LCG(const cpp_int &state, const cpp_int &a, const cpp_int &c, const cpp_int &m);

    // Advance one step; returns the state held before the step
    cpp_int next();

    // Step back one state and return it. Empty (and state untouched)
    // when a has no inverse modulo m.
    std::optional<cpp_int> prev();

    // Values of n successive next() calls
    std::vector<cpp_int> take(size_t n);

    // Same state as n calls to next(), in O(log n) multiplications
    void discard(u64 n);

    bool invertible() const;
};

bool operator==(const LCG &lhs, const LCG &rhs);
bool operator!=(const LCG &lhs, const LCG &rhs);
std::ostream &operator<<(std::ostream &os, const LCG &g);
