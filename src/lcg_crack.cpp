#include "lcg_crack.hpp"
#include "modular_arithmetic.hpp"

const char *crack_failure_str(CrackFailure why) {
    switch (why) {
    case CrackFailure::none:                  return "ok";
    case CrackFailure::insufficient_samples:  return "insufficient samples";
    case CrackFailure::negative_sample:       return "negative sample";
    case CrackFailure::degenerate_modulus:    return "degenerate modulus";
    case CrackFailure::non_invertible:        return "first difference not invertible modulo candidate";
    case CrackFailure::inconsistent_sequence: return "sequence inconsistent with a single LCG";
    }
    return "unknown";
}

static std::optional<LCG> fail(CrackFailure reason, CrackFailure *why) {
    if (why) *why = reason;
    return std::nullopt;
}

static bool has_negative(const std::vector<cpp_int> &values) {
    for (const cpp_int &v : values) {
        if (v < 0) return true;
    }
    return false;
}

cpp_int recover_modulus(const std::vector<cpp_int> &values) {
    if (values.size() < 4) return 0;

    std::vector<cpp_int> t;
    t.reserve(values.size() - 1);
    for (size_t i = 0; i + 1 < values.size(); ++i) {
        t.push_back(values[i + 1] - values[i]);
    }

    std::vector<cpp_int> z;
    z.reserve(t.size() - 2);
    for (size_t i = 0; i + 2 < t.size(); ++i) {
        z.push_back(t[i + 2] * t[i] - t[i + 1] * t[i + 1]);
    }
    return gcd_all(z);
}

// Multiplier, increment and replay check for a fixed modulus
static std::optional<LCG> solve_with_modulus(const std::vector<cpp_int> &values,
                                             const cpp_int &m,
                                             CrackFailure *why) {
    if (values.size() < 3) return fail(CrackFailure::insufficient_samples, why);
    if (m <= 1) return fail(CrackFailure::degenerate_modulus, why);

    const cpp_int t0 = values[1] - values[0];
    const cpp_int t1 = values[2] - values[1];
    std::optional<cpp_int> t0_inv = modinv(t0, m);
    if (!t0_inv) return fail(CrackFailure::non_invertible, why);

    cpp_int a = mod_floor(t1 * *t0_inv, m);
    cpp_int c = mod_floor(values[1] - a * values[0], m);

    LCG replay(values[0], a, c, m);
    for (size_t i = 0; i < values.size(); ++i) {
        if (values[i] >= m || replay.next() != values[i]) {
            return fail(CrackFailure::inconsistent_sequence, why);
        }
    }

    if (why) *why = CrackFailure::none;
    return LCG(values.back(), a, c, m);
}

std::optional<LCG> crack_lcg(const std::vector<cpp_int> &values, CrackFailure *why) {
    if (values.size() < LCG_MIN_SAMPLES) return fail(CrackFailure::insufficient_samples, why);
    if (has_negative(values)) return fail(CrackFailure::negative_sample, why);
    return solve_with_modulus(values, recover_modulus(values), why);
}

std::optional<LCG> crack_lcg_known_modulus(const std::vector<cpp_int> &values,
                                           const cpp_int &m,
                                           CrackFailure *why) {
    if (values.size() < LCG_MIN_SAMPLES_KNOWN_MODULUS) return fail(CrackFailure::insufficient_samples, why);
    if (has_negative(values)) return fail(CrackFailure::negative_sample, why);
    return solve_with_modulus(values, m, why);
}
