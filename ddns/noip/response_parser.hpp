/*
 * response_parser.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-10-2

Description: Parser for the line-oriented No-IP update response protocol

**************************************************/

#ifndef DDNS_NOIP_RESPONSE_PARSER_HPP
#define DDNS_NOIP_RESPONSE_PARSER_HPP

#include <optional>
#include <string_view>
#include <vector>

namespace ddns::noip {

/**
 * @brief Classification of one line of an update response.
 */
enum class ServerResponseType {
    Update,       ///< "good <ip>": the hostname now points at <ip>.
    NoChange,     ///< "nochg <ip>": the hostname already pointed at <ip>.
    ServerError,  ///< Provider-side failure, retry no sooner than 30 minutes.
    UserError,    ///< Needs operator action, retrying will not help.
    Unsupported,  ///< Anything else, ignored.
};

[[nodiscard]] auto toString(ServerResponseType type) -> const char *;

/**
 * @brief Returns the explanation for a known server error code, if any.
 */
[[nodiscard]] auto findServerError(std::string_view code)
    -> std::optional<std::string_view>;

/**
 * @brief Returns the explanation for a known user error code, if any.
 *
 * Known codes are nohost, badauth, badagent, !donator and abuse.
 */
[[nodiscard]] auto findUserError(std::string_view code)
    -> std::optional<std::string_view>;

/**
 * @brief Classifies one trimmed response line.
 *
 * Server and user errors are logged with their explanation; unrecognized lines
 * are logged as unsupported.
 */
[[nodiscard]] auto parseResponseLine(std::string_view line)
    -> ServerResponseType;

/**
 * @brief Classifies every non-blank line of a response body, in order.
 *
 * "\r", "\n" and "\r\n" all separate lines; each line is trimmed and blank
 * lines are skipped, so the result aligns with the submitted hostnames.
 */
[[nodiscard]] auto parseResponse(std::string_view body)
    -> std::vector<ServerResponseType>;

}  // namespace ddns::noip

#endif  // DDNS_NOIP_RESPONSE_PARSER_HPP
