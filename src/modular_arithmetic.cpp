#include "modular_arithmetic.hpp"

cpp_int mod_floor(const cpp_int &x, const cpp_int &m) {
    cpp_int r = x % m;
    if (r < 0) r += m;
    return r;
}

cpp_int egcd(const cpp_int &a, const cpp_int &b, cpp_int &x, cpp_int &y) {
    if (b == 0) {
        x = 1;
        y = 0;
        return a;
    }
    cpp_int x1, y1;
    cpp_int g = egcd(b, a % b, x1, y1);
    x = y1;
    y = x1 - (a / b) * y1;
    return g;
}

std::optional<cpp_int> modinv(const cpp_int &a, const cpp_int &m) {
    if (m <= 0) {
        throw std::runtime_error("modinv(): modulus must be positive");
    }
    // Reduce first so egcd only ever sees non-negative operands
    cpp_int x, y;
    cpp_int g = egcd(mod_floor(a, m), m, x, y);
    if (g != 1) {
        return std::nullopt;
    }
    return mod_floor(x, m);
}

cpp_int gcd_all(const std::vector<cpp_int> &v) {
    cpp_int g = 0;
    for (const cpp_int &z : v) {
        g = boost::multiprecision::gcd(g, cpp_int(abs(z)));
    }
    return g;
}
