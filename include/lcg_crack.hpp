#pragma once
#include "lcg.hpp"
#include <optional>
#include <vector>

// Why a crack attempt produced no generator
enum class CrackFailure {
    none,
    insufficient_samples,
    negative_sample,
    degenerate_modulus,
    non_invertible,
    inconsistent_sequence
};

const char *crack_failure_str(CrackFailure why);

// gcd of |t[i+2]*t[i] - t[i+1]^2| over the differences t of values.
// Every term is a multiple of the hidden modulus; 0 when there are
// fewer than four values or every term vanishes.
cpp_int recover_modulus(const std::vector<cpp_int> &values);

// Recover (a, c, m) from at least LCG_MIN_SAMPLES consecutive exact states.
// The returned generator sits on the last observed value, so its first
// next() returns that value again; discard(1) first to get only unseen
// values. The recovered
// modulus can be a multiple of the real one when the sample is short;
// longer samples make that unlikely. On failure the reason is written to
// *why when given.
std::optional<LCG> crack_lcg(const std::vector<cpp_int> &values,
                             CrackFailure *why = nullptr);

// Same as crack_lcg with m supplied, needs LCG_MIN_SAMPLES_KNOWN_MODULUS values
std::optional<LCG> crack_lcg_known_modulus(const std::vector<cpp_int> &values,
                                           const cpp_int &m,
                                           CrackFailure *why = nullptr);
