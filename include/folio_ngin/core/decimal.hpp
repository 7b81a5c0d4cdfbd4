// include/folio_ngin/core/decimal.hpp

#pragma once

#include <cstdint>
#include <ostream>
#include <string>

namespace folio_ngin {

/**
 * @brief Fixed-point decimal with 8 fractional digits
 *
 * Stored as a signed 64-bit count of 1e-8 units, the same precision as the
 * NUMERIC(20,8) columns in the database. Addition and subtraction are exact;
 * multiplication and division round half away from zero to the last digit.
 * Representable magnitude is approximately 92,233,720,368.54775807; every
 * operation that would exceed it throws std::overflow_error.
 */
class Decimal {
public:
    static constexpr int SCALE_DIGITS = 8;
    static constexpr int64_t SCALE = 100000000LL;

    Decimal() : raw_(0) {}

    explicit Decimal(double value);

    explicit Decimal(int value) : raw_(static_cast<int64_t>(value) * SCALE) {}

    /**
     * @brief Parse a decimal string such as "-1234.5678"
     * @throws std::invalid_argument on malformed input or more than 8 fractional digits
     */
    static Decimal from_string(const std::string& text);

    static Decimal from_raw(int64_t raw) {
        Decimal d;
        d.raw_ = raw;
        return d;
    }

    int64_t raw() const {
        return raw_;
    }

    double as_double() const {
        return static_cast<double>(raw_) / static_cast<double>(SCALE);
    }

    explicit operator double() const {
        return as_double();
    }

    /**
     * @brief Canonical text form, trailing zeros trimmed ("110", "0.5", "-3.25")
     */
    std::string to_string() const;

    bool is_zero() const {
        return raw_ == 0;
    }
    bool is_negative() const {
        return raw_ < 0;
    }
    bool is_positive() const {
        return raw_ > 0;
    }

    Decimal abs() const;
    Decimal operator-() const;

    Decimal operator+(const Decimal& other) const;
    Decimal operator-(const Decimal& other) const;
    Decimal operator*(const Decimal& other) const;

    /**
     * @throws std::domain_error on division by zero
     */
    Decimal operator/(const Decimal& other) const;

    Decimal& operator+=(const Decimal& other) {
        *this = *this + other;
        return *this;
    }
    Decimal& operator-=(const Decimal& other) {
        *this = *this - other;
        return *this;
    }
    Decimal& operator*=(const Decimal& other) {
        *this = *this * other;
        return *this;
    }
    Decimal& operator/=(const Decimal& other) {
        *this = *this / other;
        return *this;
    }

    bool operator==(const Decimal& other) const {
        return raw_ == other.raw_;
    }
    bool operator!=(const Decimal& other) const {
        return raw_ != other.raw_;
    }
    bool operator<(const Decimal& other) const {
        return raw_ < other.raw_;
    }
    bool operator<=(const Decimal& other) const {
        return raw_ <= other.raw_;
    }
    bool operator>(const Decimal& other) const {
        return raw_ > other.raw_;
    }
    bool operator>=(const Decimal& other) const {
        return raw_ >= other.raw_;
    }

    static Decimal min(const Decimal& a, const Decimal& b) {
        return a < b ? a : b;
    }
    static Decimal max(const Decimal& a, const Decimal& b) {
        return a < b ? b : a;
    }

private:
    int64_t raw_;
};

inline std::ostream& operator<<(std::ostream& os, const Decimal& d) {
    return os << d.to_string();
}

}  // namespace folio_ngin
