/**
 * @file quantity.cpp
 * @brief Quantity parser: <sign><digits>[.<digits>][suffix | e<exponent>].
 */

#include "cluster/quantity.hpp"

#include <cctype>
#include <limits>

namespace kube_balance {

namespace {

constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
constexpr int kMaxSignificantDigits = 18;

bool checked_mul(int64_t& value, int64_t factor) {
    if (value != 0 && factor > kMax / value) return false;
    value *= factor;
    return true;
}

bool pow10(int exponent, int64_t& out) {
    out = 1;
    for (int i = 0; i < exponent; ++i) {
        if (!checked_mul(out, 10)) return false;
    }
    return true;
}

int64_t ceil_div(int64_t numerator, int64_t denominator) {
    return numerator / denominator + (numerator % denominator != 0 ? 1 : 0);
}

struct Suffix {
    int base = 10;      ///< 10 for SI/exponent forms, 2 for Ki/Mi/...
    int exponent = 0;   ///< power of `base` (binary exponents are multiples of 10)
};

bool parse_suffix(std::string_view text, Suffix& out) {
    if (text.empty()) return true;
    if (text.size() == 2 && text[1] == 'i') {
        switch (text[0]) {
            case 'K': out = {2, 10}; return true;
            case 'M': out = {2, 20}; return true;
            case 'G': out = {2, 30}; return true;
            case 'T': out = {2, 40}; return true;
            case 'P': out = {2, 50}; return true;
            case 'E': out = {2, 60}; return true;
            default: return false;
        }
    }
    if (text.size() == 1) {
        switch (text[0]) {
            case 'm': out = {10, -3}; return true;
            case 'k': out = {10, 3};  return true;
            case 'M': out = {10, 6};  return true;
            case 'G': out = {10, 9};  return true;
            case 'T': out = {10, 12}; return true;
            case 'P': out = {10, 15}; return true;
            case 'E': out = {10, 18}; return true;
            default: return false;
        }
    }
    // Decimal exponent form: e3, E-2, e+6
    if (text[0] == 'e' || text[0] == 'E') {
        size_t pos = 1;
        int sign = 1;
        if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
            sign = text[pos] == '-' ? -1 : 1;
            ++pos;
        }
        if (pos == text.size() || text.size() - pos > 3) return false;
        int exponent = 0;
        for (; pos < text.size(); ++pos) {
            if (!std::isdigit(static_cast<unsigned char>(text[pos]))) return false;
            exponent = exponent * 10 + (text[pos] - '0');
        }
        out = {10, sign * exponent};
        return true;
    }
    return false;
}

}  // namespace

Result<Quantity> parse_quantity(std::string_view text) {
    auto invalid = [&text](std::string_view why) {
        return Error{"invalid quantity '" + std::string{text} + "': " + std::string{why}};
    };

    if (text.empty()) return invalid("empty");

    size_t pos = 0;
    bool negative = false;
    if (text[pos] == '+' || text[pos] == '-') {
        negative = text[pos] == '-';
        ++pos;
    }

    int64_t mantissa = 0;
    int significant = 0;
    int fraction_digits = 0;
    bool seen_digit = false;
    bool in_fraction = false;

    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (c == '.' && !in_fraction) {
            in_fraction = true;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) break;
        seen_digit = true;
        if (mantissa == 0 && c == '0' && !in_fraction) continue;
        if (++significant > kMaxSignificantDigits) return invalid("too many digits");
        mantissa = mantissa * 10 + (c - '0');
        if (in_fraction) ++fraction_digits;
    }
    if (!seen_digit) return invalid("missing number");

    Suffix suffix;
    if (!parse_suffix(text.substr(pos), suffix)) return invalid("unknown suffix");

    // Past ~9.2e15 units the milli count no longer fits; clamp to the limit.
    auto saturated = [negative] { return Quantity{negative ? -kMax : kMax}; };

    int64_t milli = mantissa;
    if (suffix.base == 2) {
        if (!checked_mul(milli, 1000)) return saturated();
        for (int i = 0; i < suffix.exponent / 10; ++i) {
            if (!checked_mul(milli, 1024)) return saturated();
        }
        int64_t divisor = 1;
        if (!pow10(fraction_digits, divisor)) return saturated();
        milli = ceil_div(milli, divisor);
    } else {
        int exponent = suffix.exponent + 3 - fraction_digits;
        if (exponent >= 0) {
            int64_t factor = 1;
            if (!pow10(exponent, factor) || !checked_mul(milli, factor)) {
                return saturated();
            }
        } else if (-exponent > kMaxSignificantDigits) {
            milli = milli > 0 ? 1 : 0;
        } else {
            int64_t divisor = 1;
            if (!pow10(-exponent, divisor)) return saturated();
            milli = ceil_div(milli, divisor);
        }
    }

    return Quantity{negative ? -milli : milli};
}

Quantity resource_or_zero(const ResourceList& list, std::string_view name) {
    auto it = list.find(name);
    return it == list.end() ? Quantity{} : it->second;
}

}  // namespace kube_balance
