/*
 * time.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-10-27

Description: Some useful functions about time

**************************************************/

#include "time.hpp"

#include <array>
#include <charconv>
#include <ctime>

namespace ddns::utils {

namespace {

auto readNumber(std::string_view text, size_t pos, size_t width,
                int& value) -> bool {
    if (pos + width > text.size()) {
        return false;
    }
    const char* begin = text.data() + pos;
    const char* end = begin + width;
    auto [ptr, ec] = std::from_chars(begin, end, value);
    return ec == std::errc() && ptr == end;
}

auto expect(std::string_view text, size_t pos, char c) -> bool {
    return pos < text.size() && text[pos] == c;
}

}  // namespace

auto toIsoString(SystemTimePoint timePoint) -> std::string {
    const std::time_t timeT = std::chrono::system_clock::to_time_t(timePoint);

    std::tm utcTime{};
    if (gmtime_r(&timeT, &utcTime) == nullptr) {
        THROW_TIME_CONVERT_ERROR("Failed to convert time to UTC");
    }

    std::array<char, 32> buffer{};
    if (std::strftime(buffer.data(), buffer.size(), "%Y-%m-%dT%H:%M:%SZ",
                      &utcTime) == 0) {
        THROW_TIME_CONVERT_ERROR("strftime failed with format %FT%TZ");
    }
    return std::string(buffer.data());
}

auto parseIsoString(std::string_view text) -> std::optional<SystemTimePoint> {
    using namespace std::chrono;

    int yearValue = 0;
    int monthValue = 0;
    int dayValue = 0;
    int hours = 0;
    int minutes = 0;
    int seconds = 0;

    if (!readNumber(text, 0, 4, yearValue) || !expect(text, 4, '-') ||
        !readNumber(text, 5, 2, monthValue) || !expect(text, 7, '-') ||
        !readNumber(text, 8, 2, dayValue) ||
        !(expect(text, 10, 'T') || expect(text, 10, ' ')) ||
        !readNumber(text, 11, 2, hours) || !expect(text, 13, ':') ||
        !readNumber(text, 14, 2, minutes) || !expect(text, 16, ':') ||
        !readNumber(text, 17, 2, seconds)) {
        return std::nullopt;
    }

    if (hours > 23 || minutes > 59 || seconds > 60) {
        return std::nullopt;
    }

    const year_month_day date{year{yearValue},
                              month{static_cast<unsigned>(monthValue)},
                              day{static_cast<unsigned>(dayValue)}};
    if (!date.ok()) {
        return std::nullopt;
    }

    size_t pos = 19;

    // Fractional seconds are accepted but not kept.
    if (expect(text, pos, '.')) {
        ++pos;
        size_t digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            ++pos;
            ++digits;
        }
        if (digits == 0) {
            return std::nullopt;
        }
    }

    int offsetMinutes = 0;
    if (pos == text.size()) {
        offsetMinutes = 0;
    } else if (expect(text, pos, 'Z') && pos + 1 == text.size()) {
        offsetMinutes = 0;
    } else if (expect(text, pos, '+') || expect(text, pos, '-')) {
        int offsetHours = 0;
        int offsetMins = 0;
        if (!readNumber(text, pos + 1, 2, offsetHours) ||
            !expect(text, pos + 3, ':') ||
            !readNumber(text, pos + 4, 2, offsetMins) ||
            pos + 6 != text.size() || offsetHours > 23 || offsetMins > 59) {
            return std::nullopt;
        }
        offsetMinutes = offsetHours * 60 + offsetMins;
        if (text[pos] == '-') {
            offsetMinutes = -offsetMinutes;
        }
    } else {
        return std::nullopt;
    }

    const auto localTime = sys_days{date} + std::chrono::hours{hours} +
                           std::chrono::minutes{minutes} +
                           std::chrono::seconds{seconds};
    return time_point_cast<system_clock::duration>(
        localTime - std::chrono::minutes{offsetMinutes});
}

}  // namespace ddns::utils
