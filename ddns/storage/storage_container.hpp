/*
 * storage_container.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file storage_container.hpp
 * @brief Typed JSON document persisted under the ddns storage root
 * @date 2024-10-2
 */

#ifndef DDNS_STORAGE_STORAGE_CONTAINER_HPP
#define DDNS_STORAGE_STORAGE_CONTAINER_HPP

#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "ddns/error/exception.hpp"

namespace ddns::storage {

namespace fs = std::filesystem;
using json = nlohmann::json;

/**
 * @brief Returns the default storage root, "$HOME/.dnsupdater".
 */
[[nodiscard]] auto defaultStorageRoot() -> fs::path;

/**
 * @brief Builds root/categories.../filename and creates the parent
 * directories.
 *
 * A failure to create the directories is logged; later reads and writes then
 * fail and are logged too.
 *
 * @param root The storage root.
 * @param pathAndFilename Zero or more category directories followed by the
 * file name.
 * @throws ddns::error::InvalidArgument If pathAndFilename is empty.
 */
[[nodiscard]] auto prepareStoragePath(
    const fs::path &root, const std::vector<std::string> &pathAndFilename)
    -> fs::path;

/**
 * @brief A single JSON document holding one value of type T.
 *
 * T is converted with nlohmann::json ADL to_json/from_json. Read and write
 * failures never escape: get() reports them as an absent value and set() as
 * false, both after logging.
 *
 * @tparam T The stored value type.
 */
template <typename T>
class StorageContainer {
public:
    /**
     * @brief Constructs a container stored at root/pathAndFilename.
     * @throws ddns::error::InvalidArgument If pathAndFilename is empty.
     */
    StorageContainer(const fs::path &root,
                     const std::vector<std::string> &pathAndFilename)
        : filename_(prepareStoragePath(root, pathAndFilename)) {}

    /**
     * @brief Reads the stored value.
     * @return The value, or nullopt when no document exists or it cannot be
     * read or decoded.
     */
    [[nodiscard]] auto get() const -> std::optional<T>;

    /**
     * @brief Replaces the stored value.
     *
     * The document is written pretty-printed to a temporary file next to the
     * target and then renamed over it, so readers never see a partial file.
     *
     * @return true on success.
     */
    auto set(const T &value) -> bool;

    [[nodiscard]] auto path() const -> const fs::path & { return filename_; }

private:
    fs::path filename_;
};

template <typename T>
auto StorageContainer<T>::get() const -> std::optional<T> {
    std::error_code ec;
    if (!fs::exists(filename_, ec)) {
        return std::nullopt;
    }

    try {
        std::ifstream file(filename_);
        if (!file.is_open()) {
            spdlog::error("Failed to open file for reading: {}",
                          filename_.string());
            return std::nullopt;
        }
        json document = json::parse(file);
        return document.get<T>();
    } catch (const std::exception &e) {
        spdlog::error("Failed to get value from storage file '{}': {}",
                      filename_.string(), e.what());
        return std::nullopt;
    }
}

template <typename T>
auto StorageContainer<T>::set(const T &value) -> bool {
    fs::path temporary = filename_;
    temporary += ".tmp";

    try {
        json document = value;
        {
            std::ofstream file(temporary, std::ios::trunc);
            if (!file.is_open()) {
                spdlog::error("Failed to open file for writing: {}",
                              temporary.string());
                return false;
            }
            file << document.dump(4);
            file.flush();
            if (!file) {
                spdlog::error("Failed to write storage file '{}'",
                              temporary.string());
                return false;
            }
        }

        std::error_code ec;
        fs::rename(temporary, filename_, ec);
        if (ec) {
            spdlog::error("Failed to replace storage file '{}': {}",
                          filename_.string(), ec.message());
            fs::remove(temporary, ec);
            return false;
        }
        return true;
    } catch (const std::exception &e) {
        spdlog::error("Failed to set value in storage file '{}': {}",
                      filename_.string(), e.what());
        return false;
    }
}

}  // namespace ddns::storage

#endif  // DDNS_STORAGE_STORAGE_CONTAINER_HPP
