#pragma once
#include <string_view>
#include <string>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <optional>

namespace qstats {

// Accepted literal:  [+-]? ( digits ('.' digits?)? | '.' digits ) ( [eE] [+-]? digits )?
// No inf/nan, no hex floats, no separators.
inline bool is_real_literal(std::string_view s) {
    if (s.empty()) return false;
    std::size_t i = (s[0] == '+' || s[0] == '-') ? 1 : 0;

    auto digit_at = [&](std::size_t k) {
        return k < s.size() && std::isdigit(static_cast<unsigned char>(s[k]));
    };

    std::size_t int_digits = 0, frac_digits = 0;
    while (digit_at(i)) { ++i; ++int_digits; }
    if (i < s.size() && s[i] == '.') {
        ++i;
        while (digit_at(i)) { ++i; ++frac_digits; }
    }
    if (int_digits + frac_digits == 0) return false;

    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
        ++i;
        if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
        std::size_t exp_digits = 0;
        while (digit_at(i)) { ++i; ++exp_digits; }
        if (exp_digits == 0) return false;
    }
    return i == s.size();
}

// Converts a literal to a finite double. Overflow to +-inf is a failure,
// underflow towards zero is not.
inline std::optional<double> parse_real(std::string_view s) {
    if (!is_real_literal(s)) return std::nullopt;

    const std::string t(s);
    char* end = nullptr;
    const double v = std::strtod(t.c_str(), &end);
    if (end != t.c_str() + t.size()) return std::nullopt;
    if (!std::isfinite(v)) return std::nullopt;
    return v;
}

}
