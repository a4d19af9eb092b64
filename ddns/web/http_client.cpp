/*
 * http_client.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-10-2

Description: HTTP client interface and its libcurl implementation

**************************************************/

#include "http_client.hpp"

#include <spdlog/spdlog.h>

#include "ddns/utils/string.hpp"
#include "ddns/web/curl.hpp"

namespace ddns::web {

auto HttpRequest::buildUrl() const -> std::string {
    if (query.empty()) {
        return url;
    }

    std::string result = url;
    result += url.find('?') == std::string::npos ? '?' : '&';

    bool first = true;
    for (const auto &[name, value] : query) {
        if (!first) {
            result += '&';
        }
        result += utils::urlEncode(name);
        result += '=';
        result += utils::urlEncode(value);
        first = false;
    }
    return result;
}

CurlHttpClient::CurlHttpClient(HttpClientOptions options)
    : options_(std::move(options)) {}

auto CurlHttpClient::get(const HttpRequest &request) -> HttpResponse {
    CurlWrapper curl;
    curl.setUrl(request.buildUrl())
        .setRequestMethod("GET")
        .setTimeout(static_cast<long>(options_.timeout.count()))
        .setFollowLocation(true)
        .setSSLOptions(true, true);

    if (!options_.userAgent.empty()) {
        curl.setUserAgent(options_.userAgent);
    }
    for (const auto &[key, value] : options_.headers) {
        curl.addHeader(key, value);
    }
    if (request.credentials) {
        curl.setBasicAuth(request.credentials->username,
                          request.credentials->password);
    }

    HttpResponse response;
    response.body = curl.perform();
    response.statusCode = curl.getResponseCode();
    spdlog::debug("GET {} -> {}", request.url, response.statusCode);
    return response;
}

}  // namespace ddns::web
