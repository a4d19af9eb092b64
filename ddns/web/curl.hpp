/*
 * curl.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-1-4

Description: Simple HTTP client using libcurl.

**************************************************/

#ifndef DDNS_WEB_CURL_HPP
#define DDNS_WEB_CURL_HPP

#include <curl/curl.h>
#include <memory>
#include <string>

namespace ddns::web {

/**
 * @brief A wrapper class for performing a single HTTP request with libcurl.
 *
 * Each instance owns one easy handle. Setters return the wrapper so a request
 * can be configured fluently before perform() is called.
 */
class CurlWrapper {
public:
    /**
     * @brief Constructor for CurlWrapper.
     * @throws ddns::error::CurlInitializationError If no easy handle can be
     * created.
     */
    CurlWrapper();

    /**
     * @brief Destructor for CurlWrapper.
     */
    ~CurlWrapper();

    CurlWrapper(const CurlWrapper &other) = delete;
    auto operator=(const CurlWrapper &other) -> CurlWrapper & = delete;
    CurlWrapper(CurlWrapper &&other) noexcept = delete;
    auto operator=(CurlWrapper &&other) noexcept -> CurlWrapper & = delete;

    /**
     * @brief Sets the URL for the HTTP request.
     * @param url The URL to set.
     * @return Reference to the CurlWrapper object.
     */
    auto setUrl(const std::string &url) -> CurlWrapper &;

    /**
     * @brief Sets the HTTP request method (e.g., GET, POST).
     * @param method The HTTP request method to set.
     * @return Reference to the CurlWrapper object.
     */
    auto setRequestMethod(const std::string &method) -> CurlWrapper &;

    /**
     * @brief Adds a custom header to the HTTP request.
     * @param key The header key.
     * @param value The header value.
     * @return Reference to the CurlWrapper object.
     */
    auto addHeader(const std::string &key,
                   const std::string &value) -> CurlWrapper &;

    /**
     * @brief Sets the User-Agent header sent with the request.
     * @param userAgent The client identification string.
     * @return Reference to the CurlWrapper object.
     */
    auto setUserAgent(const std::string &userAgent) -> CurlWrapper &;

    /**
     * @brief Enables HTTP Basic authentication.
     * @param username The user name.
     * @param password The password.
     * @return Reference to the CurlWrapper object.
     */
    auto setBasicAuth(const std::string &username,
                      const std::string &password) -> CurlWrapper &;

    /**
     * @brief Sets the timeout for the HTTP request.
     * @param timeout The timeout value in seconds.
     * @return Reference to the CurlWrapper object.
     */
    auto setTimeout(long timeout) -> CurlWrapper &;

    /**
     * @brief Sets whether to follow redirects.
     * @param follow Boolean value indicating whether to follow redirects.
     * @return Reference to the CurlWrapper object.
     */
    auto setFollowLocation(bool follow) -> CurlWrapper &;

    /**
     * @brief Sets SSL options for the HTTP request.
     * @param verifyPeer Boolean value indicating whether to verify the peer's
     * SSL certificate.
     * @param verifyHost Boolean value indicating whether to verify the host's
     * SSL certificate.
     * @return Reference to the CurlWrapper object.
     */
    auto setSSLOptions(bool verifyPeer, bool verifyHost) -> CurlWrapper &;

    /**
     * @brief Performs the HTTP request synchronously.
     * @return The response body.
     * @throws ddns::error::CurlRuntimeError If the transfer fails (timeout,
     * resolution or connection failure). HTTP error statuses are not transfer
     * failures; check getResponseCode().
     */
    auto perform() -> std::string;

    /**
     * @brief Returns the HTTP status of the last performed request.
     */
    [[nodiscard]] auto getResponseCode() const -> long;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

}  // namespace ddns::web

#endif  // DDNS_WEB_CURL_HPP
