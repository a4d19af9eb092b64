#ifndef DDNS_TESTS_NOIP_MOCKS_HPP
#define DDNS_TESTS_NOIP_MOCKS_HPP

#include <gmock/gmock.h>

#include "ddns/noip/ip_discovery.hpp"
#include "ddns/web/http_client.hpp"

class MockHttpClient : public ddns::web::HttpClient {
public:
    MOCK_METHOD(ddns::web::HttpResponse, get,
                (const ddns::web::HttpRequest &request), (override));
};

class MockIpAddressDiscoveryService
    : public ddns::noip::IpAddressDiscoveryService {
public:
    MOCK_METHOD(ddns::noip::IpAddressInfo, getIpAddress, (), (override));
};

#endif  // DDNS_TESTS_NOIP_MOCKS_HPP
