#pragma once

#include <time.h>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include "folio_ngin/core/date.hpp"

namespace folio_ngin {
namespace core {

/**
 * @brief Thread-safe wrapper for localtime
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_localtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (localtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return localtime_r(time, result);
#endif
}

/**
 * @brief Thread-safe wrapper for gmtime
 */
inline std::tm* safe_gmtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (gmtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return gmtime_r(time, result);
#endif
}

/**
 * @brief Get current time as a string with specified format
 * @param format Format string compatible with strftime
 * @param use_local_time If true, uses local time, otherwise GMT
 */
inline std::string get_formatted_time(const char* format, bool use_local_time = true) {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    std::tm result;

    if (use_local_time) {
        safe_localtime(&now_c, &result);
    } else {
        safe_gmtime(&now_c, &result);
    }

    char buffer[128];
    std::strftime(buffer, sizeof(buffer), format, &result);
    return std::string(buffer);
}

/**
 * @brief Format a timestamp as "YYYY-MM-DD HH:MM:SS" in UTC
 */
inline std::string format_timestamp(const Timestamp& ts) {
    auto time_t = std::chrono::system_clock::to_time_t(ts);
    std::tm time_info;
    safe_gmtime(&time_t, &time_info);
    std::ostringstream ss;
    ss << std::put_time(&time_info, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

/**
 * @brief Format a timestamp as "YYYY-MM-DD HH:MM:SS.ffffff" in UTC
 *
 * Matches the microsecond resolution of a postgres timestamp column.
 */
inline std::string format_timestamp_micros(const Timestamp& ts) {
    auto micros =
        std::chrono::duration_cast<std::chrono::microseconds>(ts.time_since_epoch()).count();
    int64_t fraction = micros % 1000000;
    if (fraction < 0) {
        fraction += 1000000;
    }
    Timestamp whole = ts - std::chrono::duration_cast<Timestamp::duration>(
                               std::chrono::microseconds(fraction));
    std::ostringstream ss;
    ss << format_timestamp(whole) << '.' << std::setw(6) << std::setfill('0') << fraction;
    return ss.str();
}

/**
 * @brief Parse "YYYY-MM-DD[ HH:MM:SS[.fraction]]" as UTC
 * Fractions finer than the clock resolution are truncated.
 * @throws std::invalid_argument on malformed text
 */
inline Timestamp parse_timestamp(const std::string& text) {
    Date date = Date::from_string(text);
    int hours = 0, minutes = 0, seconds = 0;
    std::chrono::nanoseconds fraction(0);
    if (text.size() >= 19) {
        std::tm time_info = {};
        std::istringstream ss(text.substr(11, 8));
        ss >> std::get_time(&time_info, "%H:%M:%S");
        if (ss.fail()) {
            throw std::invalid_argument("Malformed time component: " + text);
        }
        hours = time_info.tm_hour;
        minutes = time_info.tm_min;
        seconds = time_info.tm_sec;

        if (text.size() > 19) {
            if (text[19] != '.' || text.size() == 20 || text.size() > 29) {
                throw std::invalid_argument("Malformed fractional seconds: " + text);
            }
            int64_t nanos = 0;
            for (size_t i = 20; i < 29; ++i) {
                int digit = 0;
                if (i < text.size()) {
                    if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
                        throw std::invalid_argument("Malformed fractional seconds: " + text);
                    }
                    digit = text[i] - '0';
                }
                nanos = nanos * 10 + digit;
            }
            fraction = std::chrono::nanoseconds(nanos);
        }
    }
    return date.to_timestamp() + std::chrono::hours(hours) + std::chrono::minutes(minutes) +
           std::chrono::seconds(seconds) +
           std::chrono::duration_cast<Timestamp::duration>(fraction);
}

}  // namespace core
}  // namespace folio_ngin
