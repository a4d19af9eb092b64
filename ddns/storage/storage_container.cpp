/*
 * storage_container.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "storage_container.hpp"

#include "ddns/system/user.hpp"

namespace ddns::storage {

auto defaultStorageRoot() -> fs::path {
    std::string home = ddns::system::getHomeDirectory();
    if (home.empty()) {
        spdlog::warn(
            "Home directory is unknown, storing data under the current "
            "directory");
        return fs::path(".dnsupdater");
    }
    return fs::path(home) / ".dnsupdater";
}

auto prepareStoragePath(const fs::path &root,
                        const std::vector<std::string> &pathAndFilename)
    -> fs::path {
    if (pathAndFilename.empty()) {
        THROW_INVALID_ARGUMENT(
            "Argument 'pathAndFilename' cannot be empty.");
    }

    fs::path directory = root;
    for (size_t i = 0; i + 1 < pathAndFilename.size(); ++i) {
        directory /= pathAndFilename[i];
    }

    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        spdlog::error("Failed to create storage directory '{}': {}",
                      directory.string(), ec.message());
    }

    return directory / pathAndFilename.back();
}

}  // namespace ddns::storage
