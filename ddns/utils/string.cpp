/*
 * string.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-11-10

Description: Some useful string functions

**************************************************/

#include "string.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <utility>

namespace ddns::utils {

auto urlEncode(std::string_view str) -> std::string {
    if (str.empty()) {
        return {};
    }

    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex << std::uppercase;

    for (auto c : str) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) != 0 || c == '-' || c == '_' || c == '.' ||
            c == '~') {
            escaped << c;
        } else if (c == ' ') {
            escaped << '+';
        } else {
            escaped << '%' << std::setw(2) << static_cast<int>(uc);
        }
    }

    return escaped.str();
}

auto startsWith(std::string_view str, std::string_view prefix) -> bool {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

auto joinStrings(std::span<const std::string> strings,
                 std::string_view delimiter) -> std::string {
    if (strings.empty()) {
        return {};
    }

    size_t totalSize = delimiter.size() * (strings.size() - 1);
    for (const auto& s : strings) {
        totalSize += s.size();
    }

    std::string result;
    result.reserve(totalSize);

    bool first = true;
    for (const auto& s : strings) {
        if (!first) {
            result.append(delimiter);
        }
        result.append(s);
        first = false;
    }
    return result;
}

auto trim(std::string_view line, std::string_view symbols) -> std::string {
    auto first = line.find_first_not_of(symbols);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = line.find_last_not_of(symbols);
    return std::string(line.substr(first, last - first + 1));
}

auto isBlank(std::string_view str) -> bool {
    return std::ranges::all_of(
        str, [](unsigned char ch) { return std::isspace(ch) != 0; });
}

auto splitLines(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> lines;

    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find_first_of("\r\n", start);
        if (end == std::string_view::npos) {
            end = text.size();
        }

        std::string line = trim(text.substr(start, end - start));
        if (!line.empty()) {
            lines.push_back(std::move(line));
        }
        start = end + 1;
    }

    return lines;
}

}  // namespace ddns::utils
