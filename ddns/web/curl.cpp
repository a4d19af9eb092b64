/*
 * curl.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "curl.hpp"

#include <mutex>

#include <spdlog/spdlog.h>

#include "ddns/error/exception.hpp"

namespace ddns::web {

class CurlWrapper::Impl {
public:
    Impl();
    ~Impl();

    auto setUrl(const std::string &url) -> CurlWrapper::Impl &;
    auto setRequestMethod(const std::string &method) -> CurlWrapper::Impl &;
    auto addHeader(const std::string &key, const std::string &value)
        -> CurlWrapper::Impl &;
    auto setUserAgent(const std::string &userAgent) -> CurlWrapper::Impl &;
    auto setBasicAuth(const std::string &username, const std::string &password)
        -> CurlWrapper::Impl &;
    auto setTimeout(long timeout) -> CurlWrapper::Impl &;
    auto setFollowLocation(bool follow) -> CurlWrapper::Impl &;
    auto setSSLOptions(bool verifyPeer, bool verifyHost) -> CurlWrapper::Impl &;
    auto perform() -> std::string;
    [[nodiscard]] auto getResponseCode() const -> long;

private:
    CURL *handle_;
    curl_slist *headersList_;
    std::mutex mutex_;
    std::string responseData_;
    std::string userAgent_;
    std::string username_;
    std::string password_;
    long responseCode_ = 0;

    static auto writeCallback(void *contents, size_t size, size_t nmemb,
                              void *userp) -> size_t;
    void updateHeaders();
};

CurlWrapper::CurlWrapper() : pImpl_(std::make_unique<Impl>()) {}

CurlWrapper::~CurlWrapper() = default;

auto CurlWrapper::setUrl(const std::string &url) -> CurlWrapper & {
    pImpl_->setUrl(url);
    return *this;
}

auto CurlWrapper::setRequestMethod(const std::string &method) -> CurlWrapper & {
    pImpl_->setRequestMethod(method);
    return *this;
}

auto CurlWrapper::addHeader(const std::string &key, const std::string &value)
    -> CurlWrapper & {
    pImpl_->addHeader(key, value);
    return *this;
}

auto CurlWrapper::setUserAgent(const std::string &userAgent) -> CurlWrapper & {
    pImpl_->setUserAgent(userAgent);
    return *this;
}

auto CurlWrapper::setBasicAuth(const std::string &username,
                               const std::string &password) -> CurlWrapper & {
    pImpl_->setBasicAuth(username, password);
    return *this;
}

auto CurlWrapper::setTimeout(long timeout) -> CurlWrapper & {
    pImpl_->setTimeout(timeout);
    return *this;
}

auto CurlWrapper::setFollowLocation(bool follow) -> CurlWrapper & {
    pImpl_->setFollowLocation(follow);
    return *this;
}

auto CurlWrapper::setSSLOptions(bool verifyPeer, bool verifyHost)
    -> CurlWrapper & {
    pImpl_->setSSLOptions(verifyPeer, verifyHost);
    return *this;
}

auto CurlWrapper::perform() -> std::string { return pImpl_->perform(); }

auto CurlWrapper::getResponseCode() const -> long {
    return pImpl_->getResponseCode();
}

CurlWrapper::Impl::Impl() : headersList_(nullptr) {
    // Reference counted by libcurl, paired with curl_global_cleanup below.
    curl_global_init(CURL_GLOBAL_ALL);
    handle_ = curl_easy_init();
    if (handle_ == nullptr) {
        spdlog::error("Failed to initialize CURL");
        curl_global_cleanup();
        THROW_CURL_INITIALIZATION_ERROR("Failed to initialize CURL.");
    }
    curl_easy_setopt(handle_, CURLOPT_NOSIGNAL, 1L);
}

CurlWrapper::Impl::~Impl() {
    if (headersList_) {
        curl_slist_free_all(headersList_);
    }
    curl_easy_cleanup(handle_);
    curl_global_cleanup();
}

auto CurlWrapper::Impl::setUrl(const std::string &url) -> CurlWrapper::Impl & {
    spdlog::debug("Setting URL: {}", url);
    curl_easy_setopt(handle_, CURLOPT_URL, url.c_str());
    return *this;
}

auto CurlWrapper::Impl::setRequestMethod(const std::string &method)
    -> CurlWrapper::Impl & {
    spdlog::debug("Setting HTTP method: {}", method);
    if (method == "GET") {
        curl_easy_setopt(handle_, CURLOPT_HTTPGET, 1L);
    } else if (method == "POST") {
        curl_easy_setopt(handle_, CURLOPT_POST, 1L);
    } else {
        curl_easy_setopt(handle_, CURLOPT_CUSTOMREQUEST, method.c_str());
    }
    return *this;
}

auto CurlWrapper::Impl::addHeader(const std::string &key,
                                  const std::string &value)
    -> CurlWrapper::Impl & {
    spdlog::debug("Adding header: {}: {}", key, value);
    std::string header = key + ": " + value;
    headersList_ = curl_slist_append(headersList_, header.c_str());
    updateHeaders();
    return *this;
}

void CurlWrapper::Impl::updateHeaders() {
    if (headersList_) {
        curl_easy_setopt(handle_, CURLOPT_HTTPHEADER, headersList_);
    }
}

auto CurlWrapper::Impl::setUserAgent(const std::string &userAgent)
    -> CurlWrapper::Impl & {
    spdlog::debug("Setting User-Agent: {}", userAgent);
    userAgent_ = userAgent;
    curl_easy_setopt(handle_, CURLOPT_USERAGENT, userAgent_.c_str());
    return *this;
}

auto CurlWrapper::Impl::setBasicAuth(const std::string &username,
                                     const std::string &password)
    -> CurlWrapper::Impl & {
    spdlog::debug("Setting basic authentication for user '{}'", username);
    username_ = username;
    password_ = password;
    curl_easy_setopt(handle_, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
    curl_easy_setopt(handle_, CURLOPT_USERNAME, username_.c_str());
    curl_easy_setopt(handle_, CURLOPT_PASSWORD, password_.c_str());
    return *this;
}

auto CurlWrapper::Impl::setTimeout(long timeout) -> CurlWrapper::Impl & {
    spdlog::debug("Setting timeout: {}", timeout);
    curl_easy_setopt(handle_, CURLOPT_TIMEOUT, timeout);
    return *this;
}

auto CurlWrapper::Impl::setFollowLocation(bool follow) -> CurlWrapper::Impl & {
    spdlog::debug("Setting follow location: {}", follow);
    curl_easy_setopt(handle_, CURLOPT_FOLLOWLOCATION, follow ? 1L : 0L);
    return *this;
}

auto CurlWrapper::Impl::setSSLOptions(bool verifyPeer, bool verifyHost)
    -> CurlWrapper::Impl & {
    spdlog::debug("Setting SSL options: verifyPeer={}, verifyHost={}",
                  verifyPeer, verifyHost);
    curl_easy_setopt(handle_, CURLOPT_SSL_VERIFYPEER, verifyPeer ? 1L : 0L);
    curl_easy_setopt(handle_, CURLOPT_SSL_VERIFYHOST, verifyHost ? 2L : 0L);
    return *this;
}

auto CurlWrapper::Impl::perform() -> std::string {
    std::lock_guard lock(mutex_);
    responseData_.clear();
    responseData_.reserve(4096);
    responseCode_ = 0;

    curl_easy_setopt(handle_, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(handle_, CURLOPT_WRITEDATA, &responseData_);

    CURLcode res = curl_easy_perform(handle_);
    if (res != CURLE_OK) {
        spdlog::error("CURL request failed: {}", curl_easy_strerror(res));
        THROW_CURL_RUNTIME_ERROR("CURL perform failed: ",
                                 curl_easy_strerror(res));
    }

    curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &responseCode_);
    return responseData_;
}

auto CurlWrapper::Impl::getResponseCode() const -> long {
    return responseCode_;
}

auto CurlWrapper::Impl::writeCallback(void *contents, size_t size, size_t nmemb,
                                      void *userp) -> size_t {
    size_t totalSize = size * nmemb;
    auto *str = static_cast<std::string *>(userp);
    str->append(static_cast<char *>(contents), totalSize);
    return totalSize;
}

}  // namespace ddns::web
