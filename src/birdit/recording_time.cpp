//
//  recording_time.cpp
//  BirdIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "recording_time.h"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <filesystem>

namespace birdit::detail {
namespace {

constexpr std::size_t kPatternLength = 15;  // YYYYMMDD_HHMMSS

bool parse_field(const std::string& text, std::size_t offset, std::size_t count, int* value) {
    int parsed = 0;
    for (std::size_t i = offset; i < offset + count; ++i) {
        const unsigned char ch = static_cast<unsigned char>(text[i]);
        if (!std::isdigit(ch)) {
            return false;
        }
        parsed = parsed * 10 + (ch - '0');
    }
    *value = parsed;
    return true;
}

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return kDays[month - 1];
}

} // namespace

bool parse_recording_timestamp(const std::string& source_file,
                               RecordingTimestamp* timestamp,
                               std::string* error) {
    if (!timestamp) {
        return false;
    }

    const std::string stem = std::filesystem::path(source_file).stem().string();
    if (stem.size() < kPatternLength) {
        if (error) {
            *error = "file name '" + stem + "' is too short for YYYYMMDD_HHMMSS";
        }
        return false;
    }

    const std::size_t offset = stem.size() - kPatternLength;
    RecordingTimestamp parsed;
    const bool digits_ok = parse_field(stem, offset, 4, &parsed.year) &&
                           parse_field(stem, offset + 4, 2, &parsed.month) &&
                           parse_field(stem, offset + 6, 2, &parsed.day) &&
                           stem[offset + 8] == '_' &&
                           parse_field(stem, offset + 9, 2, &parsed.hour) &&
                           parse_field(stem, offset + 11, 2, &parsed.minute) &&
                           parse_field(stem, offset + 13, 2, &parsed.second);
    if (!digits_ok) {
        if (error) {
            *error = "file name '" + stem + "' does not end in YYYYMMDD_HHMMSS";
        }
        return false;
    }

    if (parsed.month < 1 || parsed.month > 12 || parsed.day < 1 ||
        parsed.day > days_in_month(parsed.year, parsed.month) || parsed.hour > 23 ||
        parsed.minute > 59 || parsed.second > 59) {
        if (error) {
            *error = "file name '" + stem + "' carries an invalid date or time";
        }
        return false;
    }

    *timestamp = parsed;
    return true;
}

std::string format_compact(const RecordingTimestamp& timestamp) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d%02d%02d_%02d%02d%02d",
                  timestamp.year, timestamp.month, timestamp.day,
                  timestamp.hour, timestamp.minute, timestamp.second);
    return buffer;
}

std::string format_with_offset(const RecordingTimestamp& timestamp, double offset_seconds) {
    std::tm start{};
    start.tm_year = timestamp.year - 1900;
    start.tm_mon = timestamp.month - 1;
    start.tm_mday = timestamp.day;
    start.tm_hour = timestamp.hour;
    start.tm_min = timestamp.minute;
    start.tm_sec = timestamp.second;
    const std::time_t base = timegm(&start);

    const long long offset_ms = std::llround(offset_seconds * 1000.0);
    long long whole_seconds = offset_ms / 1000;
    long long millis = offset_ms % 1000;
    if (millis < 0) {
        millis += 1000;
        whole_seconds -= 1;
    }

    const std::time_t shifted = base + static_cast<std::time_t>(whole_seconds);
    std::tm civil{};
    gmtime_r(&shifted, &civil);

    char buffer[40];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d %02d:%02d:%02d.%03d",
                  civil.tm_year + 1900, civil.tm_mon + 1, civil.tm_mday,
                  civil.tm_hour, civil.tm_min, civil.tm_sec, static_cast<int>(millis));
    return buffer;
}

} // namespace birdit::detail
