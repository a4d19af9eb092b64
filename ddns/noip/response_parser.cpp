/*
 * response_parser.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-10-2

Description: Parser for the line-oriented No-IP update response protocol

**************************************************/

#include "response_parser.hpp"

#include <array>
#include <utility>

#include <spdlog/spdlog.h>

#include "ddns/utils/string.hpp"

namespace ddns::noip {

namespace {

using ErrorEntry = std::pair<std::string_view, std::string_view>;

constexpr std::array<ErrorEntry, 5> USER_ERRORS{{
    {"nohost",
     "Hostname supplied does not exist under specified account. Enter new "
     "login credentials before performing an additional request."},
    {"badauth", "Invalid username password combination."},
    {"badagent",
     "Client disabled. Do not perform any more updates without user "
     "intervention. The recommended User-Agent format must be used, failure "
     "to follow it may result in the client being blocked."},
    {"!donator",
     "An update request was sent including a feature that is not available "
     "to that particular user, such as offline options."},
    {"abuse",
     "Username is blocked due to abuse, either for not following the update "
     "specifications or for violating the No-IP terms of service. Stop "
     "sending updates."},
}};

constexpr std::array<ErrorEntry, 1> SERVER_ERRORS{{
    {"911",
     "A fatal error on the provider side such as a database outage. Retry "
     "the update no sooner than 30 minutes."},
}};

template <size_t N>
auto lookup(const std::array<ErrorEntry, N> &table, std::string_view code)
    -> std::optional<std::string_view> {
    for (const auto &[key, message] : table) {
        if (key == code) {
            return message;
        }
    }
    return std::nullopt;
}

}  // namespace

auto toString(ServerResponseType type) -> const char * {
    switch (type) {
        case ServerResponseType::Update:
            return "Update";
        case ServerResponseType::NoChange:
            return "NoChange";
        case ServerResponseType::ServerError:
            return "ServerError";
        case ServerResponseType::UserError:
            return "UserError";
        case ServerResponseType::Unsupported:
            return "Unsupported";
    }
    return "Unknown";
}

auto findServerError(std::string_view code)
    -> std::optional<std::string_view> {
    return lookup(SERVER_ERRORS, code);
}

auto findUserError(std::string_view code) -> std::optional<std::string_view> {
    return lookup(USER_ERRORS, code);
}

auto parseResponseLine(std::string_view line) -> ServerResponseType {
    if (utils::startsWith(line, "good ")) {
        return ServerResponseType::Update;
    }

    if (utils::startsWith(line, "nochg ")) {
        return ServerResponseType::NoChange;
    }

    if (auto message = findServerError(line)) {
        spdlog::warn("Server responded with server error '{}': {}", line,
                     *message);
        return ServerResponseType::ServerError;
    }

    if (auto message = findUserError(line)) {
        spdlog::error("Server responded with user error '{}': {}", line,
                      *message);
        return ServerResponseType::UserError;
    }

    spdlog::warn("Unsupported response '{}'", line);
    return ServerResponseType::Unsupported;
}

auto parseResponse(std::string_view body) -> std::vector<ServerResponseType> {
    std::vector<ServerResponseType> result;
    for (const auto &line : utils::splitLines(body)) {
        result.push_back(parseResponseLine(line));
    }
    return result;
}

}  // namespace ddns::noip
