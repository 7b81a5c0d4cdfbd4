// src/core/date.cpp

#include "folio_ngin/core/date.hpp"
#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace folio_ngin {

namespace {

// Howard Hinnant's civil calendar algorithms
int32_t days_from_civil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int32_t>(doe) - 719468;
}

void civil_from_days(int32_t z, int& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int32_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<int>(yoe) + era * 400 + (m <= 2);
}

bool is_leap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned last_day_of_month(int y, unsigned m) {
    static const unsigned days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && is_leap(y)) ? 29 : days[m - 1];
}

constexpr int64_t SECONDS_PER_DAY = 86400;

}  // namespace

Date Date::from_ymd(int year, unsigned month, unsigned day) {
    if (month < 1 || month > 12 || day < 1 || day > last_day_of_month(year, month)) {
        throw std::invalid_argument("Invalid calendar date: " + std::to_string(year) + "-" +
                                    std::to_string(month) + "-" + std::to_string(day));
    }
    return from_days(days_from_civil(year, month, day));
}

Date Date::from_string(const std::string& text) {
    if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
        throw std::invalid_argument("Expected YYYY-MM-DD, got: " + text);
    }
    for (size_t i : {0, 1, 2, 3, 5, 6, 8, 9}) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            throw std::invalid_argument("Expected YYYY-MM-DD, got: " + text);
        }
    }
    // Allow a trailing time component ("2024-01-31 00:00:00") as returned by postgres
    if (text.size() > 10 && text[10] != ' ' && text[10] != 'T') {
        throw std::invalid_argument("Expected YYYY-MM-DD, got: " + text);
    }
    int year = std::stoi(text.substr(0, 4));
    unsigned month = static_cast<unsigned>(std::stoi(text.substr(5, 2)));
    unsigned day = static_cast<unsigned>(std::stoi(text.substr(8, 2)));
    return from_ymd(year, month, day);
}

Date Date::from_timestamp(const Timestamp& ts) {
    auto seconds =
        std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
    int64_t days = seconds / SECONDS_PER_DAY;
    if (seconds % SECONDS_PER_DAY < 0) {
        --days;
    }
    return from_days(static_cast<int32_t>(days));
}

Timestamp Date::to_timestamp() const {
    return Timestamp(std::chrono::seconds(static_cast<int64_t>(days_) * SECONDS_PER_DAY));
}

std::string Date::to_string() const {
    int y;
    unsigned m, d;
    civil_from_days(days_, y, m, d);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", y, m, d);
    return std::string(buffer);
}

int Date::year() const {
    int y;
    unsigned m, d;
    civil_from_days(days_, y, m, d);
    return y;
}

unsigned Date::month() const {
    int y;
    unsigned m, d;
    civil_from_days(days_, y, m, d);
    return m;
}

unsigned Date::day() const {
    int y;
    unsigned m, d;
    civil_from_days(days_, y, m, d);
    return d;
}

}  // namespace folio_ngin
