/**
 * @file time_format.cpp
 * @brief RFC 3339 conversions built on the C++20 calendar types.
 */

#include "core/time_format.hpp"

#include <cctype>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace kube_balance {

namespace {

// Reads exactly `width` decimal digits starting at `pos`.
bool read_digits(std::string_view text, size_t pos, size_t width, int& out) {
    if (pos + width > text.size()) return false;
    int value = 0;
    for (size_t i = pos; i < pos + width; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
        value = value * 10 + (text[i] - '0');
    }
    out = value;
    return true;
}

bool expect_char(std::string_view text, size_t pos, char c) {
    return pos < text.size() && text[pos] == c;
}

}  // namespace

std::string format_rfc3339(Timestamp ts) {
    using namespace std::chrono;

    auto secs = floor<seconds>(ts);
    auto day_point = floor<days>(secs);
    year_month_day ymd{day_point};
    hh_mm_ss tod{secs - day_point};

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << static_cast<int>(ymd.year()) << '-'
        << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-'
        << std::setw(2) << static_cast<unsigned>(ymd.day()) << 'T'
        << std::setw(2) << tod.hours().count() << ':'
        << std::setw(2) << tod.minutes().count() << ':'
        << std::setw(2) << tod.seconds().count() << 'Z';
    return oss.str();
}

Result<Timestamp> parse_rfc3339(std::string_view text) {
    using namespace std::chrono;

    auto invalid = [&text]() {
        return Error{"invalid RFC 3339 timestamp: '" + std::string{text} + "'"};
    };

    // 2006-01-02T15:04:05
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
    if (!read_digits(text, 0, 4, y) || !expect_char(text, 4, '-') ||
        !read_digits(text, 5, 2, mo) || !expect_char(text, 7, '-') ||
        !read_digits(text, 8, 2, d)) {
        return invalid();
    }
    if (!expect_char(text, 10, 'T') && !expect_char(text, 10, 't')) return invalid();
    if (!read_digits(text, 11, 2, h) || !expect_char(text, 13, ':') ||
        !read_digits(text, 14, 2, mi) || !expect_char(text, 16, ':') ||
        !read_digits(text, 17, 2, s)) {
        return invalid();
    }

    year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
    if (!ymd.ok() || h > 23 || mi > 59 || s > 60) return invalid();

    size_t pos = 19;
    nanoseconds fraction{0};
    if (expect_char(text, pos, '.')) {
        ++pos;
        size_t digits = 0;
        int64_t value = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 9) {
                value = value * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0) return invalid();
        for (size_t i = digits; i < 9; ++i) value *= 10;
        fraction = nanoseconds{value};
    }

    minutes offset{0};
    if (expect_char(text, pos, 'Z') || expect_char(text, pos, 'z')) {
        ++pos;
    } else if (expect_char(text, pos, '+') || expect_char(text, pos, '-')) {
        int sign = text[pos] == '-' ? -1 : 1;
        int oh = 0, om = 0;
        if (!read_digits(text, pos + 1, 2, oh) || !expect_char(text, pos + 3, ':') ||
            !read_digits(text, pos + 4, 2, om) || oh > 23 || om > 59) {
            return invalid();
        }
        offset = minutes{sign * (oh * 60 + om)};
        pos += 6;
    } else {
        return invalid();
    }
    if (pos != text.size()) return invalid();

    auto local = sys_days{ymd} + hours{h} + minutes{mi} + seconds{s};
    auto utc = local - offset;
    return Timestamp{duration_cast<system_clock::duration>(utc.time_since_epoch() + fraction)};
}

}  // namespace kube_balance
