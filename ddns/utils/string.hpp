/*
 * string.hpp
 *
 * Copyright (C) 2023-2024 Max Q. <contact@lightapt.com>
 */

/*************************************************

Date: 2023-11-10

Description: Some useful string functions

**************************************************/

#ifndef DDNS_UTILS_STRING_HPP
#define DDNS_UTILS_STRING_HPP

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ddns::utils {

/**
 * @brief Encodes the given string using URL encoding.
 *
 * Unreserved characters (alphanumerics and "-_.~") are kept, spaces become
 * '+', everything else is percent-encoded.
 *
 * @param str The string to encode.
 * @return The URL encoded string.
 */
[[nodiscard]] auto urlEncode(std::string_view str) -> std::string;

/**
 * @brief Checks if the given string starts with the specified prefix.
 *
 * @param str The string to check.
 * @param prefix The prefix to search for.
 * @return true if the string starts with the prefix, otherwise false.
 */
[[nodiscard]] auto startsWith(std::string_view str,
                              std::string_view prefix) -> bool;

/**
 * @brief Concatenates strings with a delimiter between each pair.
 *
 * @param strings The strings to concatenate.
 * @param delimiter The delimiter to use for concatenation.
 * @return The concatenated string.
 */
[[nodiscard("the result of joinStrings is not used")]]
auto joinStrings(std::span<const std::string> strings,
                 std::string_view delimiter) -> std::string;

/**
 * @brief Trims a string_view.
 *
 * @param line The string_view to trim.
 * @param symbols The symbols to trim.
 * @return The trimmed string.
 */
[[nodiscard("the result of trim is not used")]]
auto trim(std::string_view line,
          std::string_view symbols = " \n\r\t\f\v") -> std::string;

/**
 * @brief Checks whether a string is empty or consists only of whitespace.
 */
[[nodiscard]] auto isBlank(std::string_view str) -> bool;

/**
 * @brief Splits text into trimmed, non-empty lines.
 *
 * Both '\r' and '\n' act as separators, so "\r\n", "\n" and "\r" line endings
 * are all accepted. Lines that are empty or whitespace-only after trimming are
 * dropped.
 *
 * @param text The text to split.
 * @return The surviving lines in their original order.
 */
[[nodiscard("the result of splitLines is not used")]]
auto splitLines(std::string_view text) -> std::vector<std::string>;

}  // namespace ddns::utils

#endif  // DDNS_UTILS_STRING_HPP
