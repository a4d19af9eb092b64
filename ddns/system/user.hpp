/*
 * user.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef DDNS_SYSTEM_USER_HPP
#define DDNS_SYSTEM_USER_HPP

#include <string>

#include "ddns/macro.hpp"

namespace ddns::system {

/**
 * @brief Get the home directory of the current user.
 *
 * $HOME wins when set; otherwise the password database entry of the current
 * user is used.
 *
 * @return Home directory, or an empty string if it cannot be determined.
 */
DDNS_NODISCARD auto getHomeDirectory() -> std::string;

/**
 * @brief Get the directory containing the running executable.
 * @return Executable directory, falling back to the current working directory.
 */
DDNS_NODISCARD auto getExecutableDirectory() -> std::string;

}  // namespace ddns::system

#endif  // DDNS_SYSTEM_USER_HPP
