/*
 * http_client.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-10-2

Description: HTTP client interface and its libcurl implementation

**************************************************/

#ifndef DDNS_WEB_HTTP_CLIENT_HPP
#define DDNS_WEB_HTTP_CLIENT_HPP

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ddns::web {

using HeaderList = std::vector<std::pair<std::string, std::string>>;
using QueryList = std::vector<std::pair<std::string, std::string>>;

struct BasicCredentials {
    std::string username;
    std::string password;
};

/**
 * @brief A GET request: base URL, query parameters and optional credentials.
 */
struct HttpRequest {
    std::string url;
    QueryList query;  ///< Appended in order, names and values URL-encoded.
    std::optional<BasicCredentials> credentials;

    /**
     * @brief Builds the full URL including the encoded query string.
     */
    [[nodiscard]] auto buildUrl() const -> std::string;
};

struct HttpResponse {
    long statusCode = 0;
    std::string body;

    [[nodiscard]] auto isSuccess() const -> bool {
        return statusCode >= 200 && statusCode < 300;
    }
};

/**
 * @brief Settings shared by every request a client sends.
 */
struct HttpClientOptions {
    std::chrono::seconds timeout{15};
    std::string userAgent;
    HeaderList headers;
};

/**
 * @brief Minimal HTTP client seam.
 *
 * Implementations throw on transport failures (no connection, timeout) and
 * return any HTTP status, successful or not, as an HttpResponse.
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    /**
     * @brief Sends a GET request.
     * @throws ddns::error::CurlRuntimeError On transport failure.
     */
    virtual auto get(const HttpRequest &request) -> HttpResponse = 0;
};

/**
 * @brief HttpClient backed by libcurl through CurlWrapper.
 */
class CurlHttpClient final : public HttpClient {
public:
    explicit CurlHttpClient(HttpClientOptions options);

    auto get(const HttpRequest &request) -> HttpResponse override;

    [[nodiscard]] auto options() const -> const HttpClientOptions & {
        return options_;
    }

private:
    HttpClientOptions options_;
};

}  // namespace ddns::web

#endif  // DDNS_WEB_HTTP_CLIENT_HPP
