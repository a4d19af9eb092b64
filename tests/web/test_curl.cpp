#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include "ddns/error/exception.hpp"
#include "ddns/web/curl.hpp"
#include "ddns/web/http_client.hpp"

using namespace ddns::web;

class CurlWrapperTest : public ::testing::Test {
protected:
    void SetUp() override { spdlog::set_level(spdlog::level::off); }
};

TEST_F(CurlWrapperTest, SettersChain) {
    CurlWrapper curl;
    EXPECT_NO_THROW(curl.setUrl("http://127.0.0.1:1/")
                        .setRequestMethod("GET")
                        .addHeader("Accept", "text/plain")
                        .setUserAgent("ddns-updater/test")
                        .setBasicAuth("user", "secret")
                        .setTimeout(5)
                        .setFollowLocation(true)
                        .setSSLOptions(true, true));
    EXPECT_EQ(curl.getResponseCode(), 0);
}

TEST_F(CurlWrapperTest, ConnectionRefusedThrows) {
    CurlWrapper curl;
    curl.setUrl("http://127.0.0.1:1/").setTimeout(5);
    EXPECT_THROW(curl.perform(), ddns::error::CurlRuntimeError);
}

TEST_F(CurlWrapperTest, ClientReportsTransportFailure) {
    HttpClientOptions options;
    options.timeout = std::chrono::seconds(5);
    CurlHttpClient client(options);
    EXPECT_THROW((void)client.get(HttpRequest{"http://127.0.0.1:1/", {}, {}}),
                 ddns::error::CurlRuntimeError);
}
