/**
 * @file time_utils.cpp
 * @brief Time formatting and parsing implementation
 */

#include "imghost/utils/time_utils.h"
#include <cctype>
#include <cstdio>
#include <ctime>

namespace imghost {
namespace utils {

namespace {

bool readDigits(const std::string& s, size_t& pos, size_t count, int& out) {
    if (pos + count > s.size()) {
        return false;
    }
    int value = 0;
    for (size_t i = 0; i < count; ++i) {
        char c = s[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    pos += count;
    out = value;
    return true;
}

bool expect(const std::string& s, size_t& pos, char c) {
    if (pos < s.size() && s[pos] == c) {
        ++pos;
        return true;
    }
    return false;
}

} // namespace

std::string formatIso8601(const std::chrono::system_clock::time_point& tp,
                          bool includeMilliseconds) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    struct tm tmUtc;
    if (!gmtime_r(&t, &tmUtc)) {
        return "";
    }

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tmUtc);
    std::string result(buf);

    if (includeMilliseconds) {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            tp.time_since_epoch()).count() % 1000;
        if (ms < 0) {
            ms += 1000;
        }
        char msBuf[8];
        std::snprintf(msBuf, sizeof(msBuf), ".%03lld", static_cast<long long>(ms));
        result += msBuf;
    }
    return result + "Z";
}

std::optional<std::chrono::system_clock::time_point> parseTimestamp(const std::string& text) {
    size_t pos = 0;
    int year, month, day, hour, minute, second;

    if (!readDigits(text, pos, 4, year) || !expect(text, pos, '-') ||
        !readDigits(text, pos, 2, month) || !expect(text, pos, '-') ||
        !readDigits(text, pos, 2, day)) {
        return std::nullopt;
    }
    if (!(expect(text, pos, 'T') || expect(text, pos, ' '))) {
        return std::nullopt;
    }
    if (!readDigits(text, pos, 2, hour) || !expect(text, pos, ':') ||
        !readDigits(text, pos, 2, minute) || !expect(text, pos, ':') ||
        !readDigits(text, pos, 2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    // Fractional seconds, kept to microsecond precision
    long long micros = 0;
    if (expect(text, pos, '.')) {
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 6) {
                micros = micros * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (int i = digits; i < 6; ++i) {
            micros *= 10;
        }
    }

    int offsetSeconds = 0;
    if (pos < text.size()) {
        char sign = text[pos];
        if (sign == 'Z' || sign == 'z') {
            ++pos;
        } else if (sign == '+' || sign == '-') {
            ++pos;
            int oh = 0, om = 0;
            if (!readDigits(text, pos, 2, oh)) {
                return std::nullopt;
            }
            expect(text, pos, ':');
            if (pos < text.size() && !readDigits(text, pos, 2, om)) {
                return std::nullopt;
            }
            offsetSeconds = (oh * 3600 + om * 60) * (sign == '-' ? -1 : 1);
        } else {
            return std::nullopt;
        }
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    struct tm tmUtc = {};
    tmUtc.tm_year = year - 1900;
    tmUtc.tm_mon = month - 1;
    tmUtc.tm_mday = day;
    tmUtc.tm_hour = hour;
    tmUtc.tm_min = minute;
    tmUtc.tm_sec = second;
    std::time_t t = timegm(&tmUtc);

    auto tp = std::chrono::system_clock::from_time_t(t - offsetSeconds);
    return tp + std::chrono::duration_cast<std::chrono::system_clock::duration>(
        std::chrono::microseconds(micros));
}

std::string getCurrentIso8601(bool includeMilliseconds) {
    return formatIso8601(std::chrono::system_clock::now(), includeMilliseconds);
}

long long elapsedMillis(const std::chrono::steady_clock::time_point& start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
}

} // namespace utils
} // namespace imghost
