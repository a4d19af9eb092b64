/*
 * user.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "user.hpp"

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>

#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace ddns::system {

auto getHomeDirectory() -> std::string {
    spdlog::debug("Retrieving user home directory");
    std::string homeDir;

    if (const char *env = std::getenv("HOME"); env != nullptr && *env != '\0') {
        homeDir = env;
    } else {
        struct passwd *userInfo = getpwuid(getuid());
        if (userInfo != nullptr) {
            homeDir = std::string(userInfo->pw_dir);
        } else {
            spdlog::error("Failed to get user information for home directory");
        }
    }

    spdlog::debug("Home directory: {}", homeDir);
    return homeDir;
}

auto getExecutableDirectory() -> std::string {
    std::array<char, 4096> path{};
    ssize_t len = readlink("/proc/self/exe", path.data(), path.size() - 1);
    if (len > 0) {
        path[len] = '\0';
        return fs::path(path.data()).parent_path().string();
    }
    spdlog::warn("readlink /proc/self/exe failed: {}", strerror(errno));

    std::error_code ec;
    fs::path current = fs::current_path(ec);
    if (ec) {
        spdlog::error("Failed to get current path: {}", ec.message());
        return ".";
    }
    return current.string();
}

}  // namespace ddns::system
