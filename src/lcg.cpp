#include "lcg.hpp"
#include "modular_arithmetic.hpp"
#include <stdexcept>

LCG::LCG(const cpp_int &state, const cpp_int &a, const cpp_int &c, const cpp_int &m)
    : state(state), a(a), c(c), m(m) {
    if (m <= 1) {
        throw std::invalid_argument("LCG: modulus must be greater than 1 (got " + m.str() + ")");
    }
}

cpp_int LCG::next() {
    cpp_int out = state;
    state = mod_floor(a * state + c, m);
    return out;
}

std::optional<cpp_int> LCG::prev() {
    std::optional<cpp_int> a_inv = modinv(a, m);
    if (!a_inv) return std::nullopt;
    state = mod_floor((state - c) * *a_inv, m);
    return state;
}

std::vector<cpp_int> LCG::take(size_t n) {
    std::vector<cpp_int> out;
    out.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        out.push_back(next());
    }
    return out;
}

void LCG::discard(u64 n) {
    // (mul, add) accumulates x -> mul*x + add for the bits of n consumed so far;
    // powers of one affine map commute, so the composition order is free.
    cpp_int mul = 1, add = 0;
    cpp_int step_mul = mod_floor(a, m), step_add = mod_floor(c, m);
    while (n > 0) {
        if (n & 1) {
            mul = (mul * step_mul) % m;
            add = (add * step_mul + step_add) % m;
        }
        step_add = (step_add * step_mul + step_add) % m;
        step_mul = (step_mul * step_mul) % m;
        n >>= 1;
    }
    state = mod_floor(mul * state + add, m);
}

bool LCG::invertible() const {
    return boost::multiprecision::gcd(mod_floor(a, m), m) == 1;
}

bool operator==(const LCG &lhs, const LCG &rhs) {
    return lhs.state == rhs.state && lhs.a == rhs.a &&
           lhs.c == rhs.c && lhs.m == rhs.m;
}

bool operator!=(const LCG &lhs, const LCG &rhs) {
    return !(lhs == rhs);
}

std::ostream &operator<<(std::ostream &os, const LCG &g) {
    return os << "LCG{state=" << g.state << ", a=" << g.a
              << ", c=" << g.c << ", m=" << g.m << "}";
}
