// include/folio_ngin/core/date.hpp

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>

namespace folio_ngin {

using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Civil calendar date (proleptic Gregorian), UTC
 * Stored as days since 1970-01-01
 */
class Date {
public:
    Date() : days_(0) {}

    static Date from_days(int32_t days_since_epoch) {
        Date d;
        d.days_ = days_since_epoch;
        return d;
    }

    /**
     * @brief Build from year/month/day
     * @throws std::invalid_argument for an impossible date
     */
    static Date from_ymd(int year, unsigned month, unsigned day);

    /**
     * @brief Parse ISO "YYYY-MM-DD"
     * @throws std::invalid_argument on malformed text
     */
    static Date from_string(const std::string& text);

    /**
     * @brief Calendar date of a timestamp (UTC)
     */
    static Date from_timestamp(const Timestamp& ts);

    /**
     * @brief Midnight UTC at the start of this date
     */
    Timestamp to_timestamp() const;

    std::string to_string() const;

    int year() const;
    unsigned month() const;
    unsigned day() const;

    int32_t days_since_epoch() const {
        return days_;
    }

    Date operator+(int days) const {
        return from_days(days_ + days);
    }
    Date operator-(int days) const {
        return from_days(days_ - days);
    }
    int operator-(const Date& other) const {
        return days_ - other.days_;
    }
    Date& operator++() {
        ++days_;
        return *this;
    }

    bool operator==(const Date& other) const {
        return days_ == other.days_;
    }
    bool operator!=(const Date& other) const {
        return days_ != other.days_;
    }
    bool operator<(const Date& other) const {
        return days_ < other.days_;
    }
    bool operator<=(const Date& other) const {
        return days_ <= other.days_;
    }
    bool operator>(const Date& other) const {
        return days_ > other.days_;
    }
    bool operator>=(const Date& other) const {
        return days_ >= other.days_;
    }

private:
    int32_t days_;
};

inline std::ostream& operator<<(std::ostream& os, const Date& d) {
    return os << d.to_string();
}

/**
 * @brief Inclusive range of calendar dates
 */
struct DateRange {
    Date start;
    Date end;

    DateRange() = default;
    DateRange(Date s, Date e) : start(s), end(e) {}

    bool is_valid() const {
        return start <= end;
    }

    bool contains(const Date& d) const {
        return start <= d && d <= end;
    }

    /**
     * @brief Number of calendar dates in the range
     */
    int size() const {
        return is_valid() ? (end - start) + 1 : 0;
    }
};

}  // namespace folio_ngin

namespace std {
template <>
struct hash<folio_ngin::Date> {
    size_t operator()(const folio_ngin::Date& d) const noexcept {
        return std::hash<int32_t>()(d.days_since_epoch());
    }
};
}  // namespace std
