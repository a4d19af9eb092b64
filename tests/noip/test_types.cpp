#include <gtest/gtest.h>

#include <chrono>

#include "ddns/noip/types.hpp"

using namespace ddns::noip;
using namespace std::chrono_literals;

TEST(CachedIpSnapshotTest, JsonShape) {
    CachedIpSnapshot snapshot{IpAddress{"1.2.3.4"},
                              std::chrono::sys_days{std::chrono::year{2024} /
                                                    std::chrono::May / 1} +
                                  10h + 20min + 30s};
    json j = snapshot;
    EXPECT_EQ(j["ipAddress"].get<std::string>(), "1.2.3.4");
    EXPECT_EQ(j["lastTimeChecked"].get<std::string>(), "2024-05-01T10:20:30Z");

    auto decoded = j.get<CachedIpSnapshot>();
    EXPECT_EQ(decoded.ipAddress, snapshot.ipAddress);
    EXPECT_EQ(decoded.lastTimeChecked, snapshot.lastTimeChecked);
}

TEST(CachedIpSnapshotTest, AcceptsOffsetTimestamps) {
    auto j = json::parse(
        R"({"ipAddress": "1.2.3.4", "lastTimeChecked": "2024-05-01T12:20:30.5+02:00"})");
    auto decoded = j.get<CachedIpSnapshot>();
    EXPECT_EQ(std::chrono::floor<std::chrono::seconds>(decoded.lastTimeChecked),
              std::chrono::sys_days{std::chrono::year{2024} / std::chrono::May /
                                    1} +
                  10h + 20min + 30s);
}

TEST(CachedIpSnapshotTest, RejectsBadTimestamp) {
    auto j = json::parse(R"({"ipAddress": "1.2.3.4", "lastTimeChecked": "x"})");
    EXPECT_THROW((void)j.get<CachedIpSnapshot>(), ddns::error::InvalidArgument);
}

TEST(HostnameIpMapTest, FlatJsonObject) {
    HostnameIpMap map;
    map.set(Hostname{"a.example.com"}, IpAddress{"1.1.1.1"});
    map.set(Hostname{"b.example.com"}, IpAddress{"2.2.2.2"});
    map.set(Hostname{"a.example.com"}, IpAddress{"3.3.3.3"});

    json j = map;
    EXPECT_EQ(j.dump(), R"({"a.example.com":"3.3.3.3","b.example.com":"2.2.2.2"})");
    EXPECT_EQ(j.get<HostnameIpMap>(), map);
}

TEST(HostnameIpMapTest, Find) {
    HostnameIpMap map;
    EXPECT_TRUE(map.empty());
    EXPECT_FALSE(map.find(Hostname{"a"}).has_value());

    map.set(Hostname{"a"}, IpAddress{"1.1.1.1"});
    EXPECT_EQ(map.size(), 1u);
    EXPECT_EQ(map.find(Hostname{"a"}), IpAddress{"1.1.1.1"});
}

TEST(HostnameIpMapTest, RejectsNonObject) {
    EXPECT_THROW((void)json::parse("[]").get<HostnameIpMap>(),
                 ddns::error::InvalidArgument);
}

TEST(DataSourceTest, ToString) {
    EXPECT_STREQ(toString(DataSource::None), "none");
    EXPECT_STREQ(toString(DataSource::Cache), "cache");
    EXPECT_STREQ(toString(DataSource::Network), "network");
}
