// src/core/decimal.cpp

#include "folio_ngin/core/decimal.hpp"
#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace folio_ngin {

namespace {

using wide_int = __int128;

int64_t narrow(wide_int value) {
    if (value > static_cast<wide_int>(std::numeric_limits<int64_t>::max()) ||
        value < static_cast<wide_int>(std::numeric_limits<int64_t>::min())) {
        throw std::overflow_error("Decimal overflow");
    }
    return static_cast<int64_t>(value);
}

// Integer division rounding half away from zero
wide_int divide_rounded(wide_int numerator, wide_int denominator) {
    bool negative = (numerator < 0) != (denominator < 0);
    wide_int n = numerator < 0 ? -numerator : numerator;
    wide_int d = denominator < 0 ? -denominator : denominator;
    wide_int q = n / d;
    if ((n % d) * 2 >= d) {
        ++q;
    }
    return negative ? -q : q;
}

}  // namespace

Decimal::Decimal(double value) {
    if (!std::isfinite(value)) {
        throw std::invalid_argument("Decimal cannot represent a non-finite value");
    }
    double scaled = std::round(value * static_cast<double>(SCALE));
    if (scaled >= 9.2e18 || scaled <= -9.2e18) {
        throw std::overflow_error("Decimal overflow");
    }
    raw_ = static_cast<int64_t>(scaled);
}

Decimal Decimal::from_string(const std::string& text) {
    size_t pos = 0;
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }
    size_t end = text.size();
    while (end > pos && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    if (pos == end) {
        throw std::invalid_argument("Empty decimal string");
    }

    bool negative = false;
    if (text[pos] == '-' || text[pos] == '+') {
        negative = text[pos] == '-';
        ++pos;
    }

    wide_int integer_part = 0;
    wide_int fraction_part = 0;
    int fraction_digits = 0;
    bool seen_digit = false;
    bool seen_point = false;

    for (; pos < end; ++pos) {
        char c = text[pos];
        if (c == '.') {
            if (seen_point) {
                throw std::invalid_argument("Malformed decimal: " + text);
            }
            seen_point = true;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("Malformed decimal: " + text);
        }
        seen_digit = true;
        if (seen_point) {
            if (fraction_digits == SCALE_DIGITS) {
                if (c != '0') {
                    throw std::invalid_argument("Too many fractional digits: " + text);
                }
                continue;
            }
            fraction_part = fraction_part * 10 + (c - '0');
            ++fraction_digits;
        } else {
            integer_part = integer_part * 10 + (c - '0');
            if (integer_part > static_cast<wide_int>(std::numeric_limits<int64_t>::max())) {
                throw std::overflow_error("Decimal overflow: " + text);
            }
        }
    }
    if (!seen_digit) {
        throw std::invalid_argument("Malformed decimal: " + text);
    }

    for (int i = fraction_digits; i < SCALE_DIGITS; ++i) {
        fraction_part *= 10;
    }
    wide_int raw = integer_part * SCALE + fraction_part;
    return from_raw(narrow(negative ? -raw : raw));
}

std::string Decimal::to_string() const {
    wide_int value = raw_;
    bool negative = value < 0;
    if (negative) {
        value = -value;
    }
    auto integer_part = static_cast<uint64_t>(value / SCALE);
    auto fraction_part = static_cast<uint64_t>(value % SCALE);

    std::string out = negative ? "-" : "";
    out += std::to_string(integer_part);
    if (fraction_part != 0) {
        std::string digits = std::to_string(fraction_part);
        digits.insert(0, SCALE_DIGITS - digits.size(), '0');
        while (!digits.empty() && digits.back() == '0') {
            digits.pop_back();
        }
        out += "." + digits;
    }
    return out;
}

Decimal Decimal::abs() const {
    return raw_ < 0 ? -*this : *this;
}

Decimal Decimal::operator-() const {
    return from_raw(narrow(-static_cast<wide_int>(raw_)));
}

Decimal Decimal::operator+(const Decimal& other) const {
    return from_raw(narrow(static_cast<wide_int>(raw_) + static_cast<wide_int>(other.raw_)));
}

Decimal Decimal::operator-(const Decimal& other) const {
    return from_raw(narrow(static_cast<wide_int>(raw_) - static_cast<wide_int>(other.raw_)));
}

Decimal Decimal::operator*(const Decimal& other) const {
    wide_int product = static_cast<wide_int>(raw_) * static_cast<wide_int>(other.raw_);
    return from_raw(narrow(divide_rounded(product, SCALE)));
}

Decimal Decimal::operator/(const Decimal& other) const {
    if (other.raw_ == 0) {
        throw std::domain_error("Decimal division by zero");
    }
    wide_int numerator = static_cast<wide_int>(raw_) * SCALE;
    return from_raw(narrow(divide_rounded(numerator, other.raw_)));
}

}  // namespace folio_ngin
