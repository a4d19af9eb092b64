/*
 * time.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-10-27

Description: Some useful functions about time

**************************************************/

#ifndef DDNS_UTILS_TIME_HPP
#define DDNS_UTILS_TIME_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include "ddns/error/exception.hpp"

class TimeConvertError : public ddns::error::Exception {
public:
    using ddns::error::Exception::Exception;
};

#define THROW_TIME_CONVERT_ERROR(...)                                     \
    throw TimeConvertError(DDNS_FILE_NAME, DDNS_FILE_LINE, DDNS_FUNC_NAME, \
                           __VA_ARGS__)

namespace ddns::utils {

using SystemTimePoint = std::chrono::system_clock::time_point;

/**
 * @brief Formats a time point as an ISO 8601 UTC timestamp.
 *
 * The output has second precision, e.g. "2024-05-01T10:20:30Z".
 *
 * @param timePoint The time point to format.
 * @return std::string The formatted timestamp.
 * @throws TimeConvertError If the time point cannot be represented in UTC.
 */
[[nodiscard]] auto toIsoString(SystemTimePoint timePoint) -> std::string;

/**
 * @brief Parses an ISO 8601 timestamp.
 *
 * Accepts "YYYY-MM-DDTHH:MM:SS" followed by an optional fraction of a second
 * and then either "Z" or a "+HH:MM"/"-HH:MM" offset. A missing zone designator
 * is read as UTC.
 *
 * @param text The timestamp text.
 * @return std::optional<SystemTimePoint> The parsed time point, or nullopt if
 * the text is not a valid timestamp.
 */
[[nodiscard]] auto parseIsoString(std::string_view text)
    -> std::optional<SystemTimePoint>;

}  // namespace ddns::utils

#endif  // DDNS_UTILS_TIME_HPP
