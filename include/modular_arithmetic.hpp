#pragma once
#include "bigint_utils.hpp"
#include <optional>
#include <stdexcept>
#include <vector>

// Floor remainder: result in [0, m) for m > 0, whatever the sign of x
cpp_int mod_floor(const cpp_int &x, const cpp_int &m);

// Extended Euclid: returns g = gcd(a, b) with a*x + b*y == g
cpp_int egcd(const cpp_int &a, const cpp_int &b, cpp_int &x, cpp_int &y);

// Inverse of a modulo m, empty when gcd(a, m) != 1.
// Throws std::runtime_error for m <= 0.
std::optional<cpp_int> modinv(const cpp_int &a, const cpp_int &m);

// gcd of |v| over all entries; 0 for an empty or all-zero input
cpp_int gcd_all(const std::vector<cpp_int> &v);
