// =================================================================
// src/Rewind/Timestamp.cpp
// =================================================================
// Implementation of ISO-8601 timestamp helpers.

#include "Rewind/Timestamp.hpp"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace Rewind {

static bool toUtc(std::time_t seconds, std::tm& out) {
#if defined(_WIN32)
    return gmtime_s(&out, &seconds) == 0;
#else
    return gmtime_r(&seconds, &out) != nullptr;
#endif
}

static std::time_t fromUtc(std::tm& tm) {
#if defined(_WIN32)
    return _mkgmtime(&tm);
#else
    return timegm(&tm);
#endif
}

static bool readDigits(const std::string& text, size_t& pos, size_t count, int& value) {
    if (pos + count > text.size()) {
        return false;
    }
    value = 0;
    for (size_t i = 0; i < count; ++i) {
        char c = text[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    pos += count;
    return true;
}

static bool expect(const std::string& text, size_t& pos, char c) {
    if (pos >= text.size() || text[pos] != c) {
        return false;
    }
    ++pos;
    return true;
}

int64_t toEpochMillis(const std::chrono::system_clock::time_point& time_point) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()).count();
}

std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point) {
    auto time_t = std::chrono::system_clock::to_time_t(time_point);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()) % 1000;
    
    std::tm utc_tm{};
    toUtc(time_t, utc_tm);
    
    std::ostringstream oss;
    oss << std::put_time(&utc_tm, "%Y-%m-%dT%H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";
    return oss.str();
}

std::string currentTimestamp() {
    return formatTimestamp(std::chrono::system_clock::now());
}

std::optional<int64_t> parseTimestamp(const std::string& text) {
    size_t pos = 0;
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    
    if (!readDigits(text, pos, 4, year) || !expect(text, pos, '-') ||
        !readDigits(text, pos, 2, month) || !expect(text, pos, '-') ||
        !readDigits(text, pos, 2, day)) {
        return std::nullopt;
    }
    if (pos >= text.size() || (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' ')) {
        return std::nullopt;
    }
    ++pos;
    if (!readDigits(text, pos, 2, hour) || !expect(text, pos, ':') ||
        !readDigits(text, pos, 2, minute) || !expect(text, pos, ':') ||
        !readDigits(text, pos, 2, second)) {
        return std::nullopt;
    }
    
    int64_t millis = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        size_t digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 3) {
                millis = millis * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (size_t i = digits; i < 3; ++i) {
            millis *= 10;
        }
    }
    
    int64_t offset_minutes = 0;
    if (pos < text.size()) {
        char designator = text[pos++];
        if (designator == 'Z' || designator == 'z') {
            // UTC
        } else if (designator == '+' || designator == '-') {
            int offset_hours = 0, offset_mins = 0;
            if (!readDigits(text, pos, 2, offset_hours)) {
                return std::nullopt;
            }
            expect(text, pos, ':');
            if (!readDigits(text, pos, 2, offset_mins) || offset_hours > 23 || offset_mins > 59) {
                return std::nullopt;
            }
            offset_minutes = offset_hours * 60 + offset_mins;
            if (designator == '-') {
                offset_minutes = -offset_minutes;
            }
        } else {
            return std::nullopt;
        }
    }
    if (pos != text.size()) {
        return std::nullopt;
    }
    
    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }
    
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    std::time_t seconds = fromUtc(tm);
    
    // timegm normalizes out-of-range days (e.g. Feb 30); reject those
    std::tm check{};
    if (!toUtc(seconds, check) || check.tm_mday != day || check.tm_mon != month - 1) {
        return std::nullopt;
    }
    
    return static_cast<int64_t>(seconds) * 1000 + millis - offset_minutes * 60 * 1000;
}

} // namespace Rewind
