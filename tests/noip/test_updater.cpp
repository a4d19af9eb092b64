#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <random>

#include "ddns/noip/updater.hpp"
#include "mocks.hpp"

using namespace ddns::noip;
using ddns::web::HttpRequest;
using ddns::web::HttpResponse;
using ::testing::_;
using ::testing::DoAll;
using ::testing::Return;
using ::testing::SaveArg;
using ::testing::Throw;

namespace fs = std::filesystem;

namespace {

auto networkInfo(const std::string &address) -> IpAddressInfo {
    return IpAddressInfo(IpAddress{address}, std::chrono::system_clock::now(),
                         DataSource::Network);
}

auto entry(std::vector<std::string> hostnames,
           std::optional<std::string> ipAddress = std::nullopt)
    -> DnsUpdateConfigurationElement {
    DnsUpdateConfigurationElement element;
    element.username = "user@example.com";
    element.password = "secret";
    for (auto &hostname : hostnames) {
        element.hostnames.push_back(Hostname{std::move(hostname)});
    }
    if (ipAddress) {
        element.ipAddress = IpAddress{*ipAddress};
    }
    return element;
}

auto queryValue(const HttpRequest &request, const std::string &name)
    -> std::optional<std::string> {
    for (const auto &[key, value] : request.query) {
        if (key == name) {
            return value;
        }
    }
    return std::nullopt;
}

}  // namespace

class NoipDnsUpdaterTest : public ::testing::Test {
protected:
    void SetUp() override {
        spdlog::set_level(spdlog::level::off);
        std::random_device rd;
        root_ = fs::temp_directory_path() /
                ("ddns_updater_test_" + std::to_string(rd()));
        database_ =
            std::make_unique<ddns::storage::StorageContainer<HostnameIpMap>>(
                root_, std::vector<std::string>{"noip", "db.json"});
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    auto makeUpdater(DnsUpdateConfiguration configuration)
        -> std::unique_ptr<NoipDnsUpdater> {
        return std::make_unique<NoipDnsUpdater>(discovery_, client_, *database_,
                                                std::move(configuration));
    }

    auto storedMap() -> HostnameIpMap {
        return database_->get().value_or(HostnameIpMap{});
    }

    fs::path root_;
    MockIpAddressDiscoveryService discovery_;
    MockHttpClient client_;
    std::unique_ptr<ddns::storage::StorageContainer<HostnameIpMap>> database_;
};

TEST_F(NoipDnsUpdaterTest, Name) {
    EXPECT_EQ(makeUpdater({})->name(), "noip.com DNS service");
}

TEST_F(NoipDnsUpdaterTest, FirstRunUpdatesEveryHostname) {
    EXPECT_CALL(discovery_, getIpAddress())
        .WillOnce(Return(networkInfo("9.9.9.9")));

    HttpRequest sent;
    EXPECT_CALL(client_, get(_))
        .WillOnce(DoAll(SaveArg<0>(&sent),
                        Return(HttpResponse{200, "good 9.9.9.9\nnochg 9.9.9.9"})));

    makeUpdater({entry({"a.example.com", "b.example.com"})})->update();

    EXPECT_EQ(sent.url, "https://dynupdate.no-ip.com/nic/update");
    EXPECT_EQ(queryValue(sent, "hostname"), "a.example.com,b.example.com");
    EXPECT_FALSE(queryValue(sent, "myip").has_value());
    ASSERT_TRUE(sent.credentials.has_value());
    EXPECT_EQ(sent.credentials->username, "user@example.com");
    EXPECT_EQ(sent.credentials->password, "secret");
    EXPECT_EQ(sent.buildUrl(),
              "https://dynupdate.no-ip.com/nic/"
              "update?hostname=a.example.com%2Cb.example.com");

    auto map = storedMap();
    EXPECT_EQ(map.size(), 2u);
    EXPECT_EQ(map.find(Hostname{"a.example.com"}), IpAddress{"9.9.9.9"});
    EXPECT_EQ(map.find(Hostname{"b.example.com"}), IpAddress{"9.9.9.9"});
}

TEST_F(NoipDnsUpdaterTest, UpToDateHostnamesSendNothing) {
    HostnameIpMap map;
    map.set(Hostname{"a.example.com"}, IpAddress{"9.9.9.9"});
    map.set(Hostname{"b.example.com"}, IpAddress{"9.9.9.9"});
    ASSERT_TRUE(database_->set(map));

    EXPECT_CALL(discovery_, getIpAddress())
        .WillOnce(Return(networkInfo("9.9.9.9")));
    EXPECT_CALL(client_, get(_)).Times(0);

    makeUpdater({entry({"a.example.com", "b.example.com"})})->update();

    EXPECT_EQ(storedMap(), map);
}

TEST_F(NoipDnsUpdaterTest, OnlyChangedHostnamesAreSent) {
    HostnameIpMap map;
    map.set(Hostname{"a.example.com"}, IpAddress{"9.9.9.9"});
    map.set(Hostname{"b.example.com"}, IpAddress{"1.1.1.1"});
    ASSERT_TRUE(database_->set(map));

    EXPECT_CALL(discovery_, getIpAddress())
        .WillOnce(Return(networkInfo("9.9.9.9")));
    HttpRequest sent;
    EXPECT_CALL(client_, get(_))
        .WillOnce(DoAll(SaveArg<0>(&sent),
                        Return(HttpResponse{200, "good 9.9.9.9"})));

    makeUpdater({entry({"a.example.com", "b.example.com", "c.example.com"})})
        ->update();

    EXPECT_EQ(queryValue(sent, "hostname"), "b.example.com,c.example.com");
    // One line for two hostnames: the response is rejected.
    EXPECT_EQ(storedMap(), map);
}

TEST_F(NoipDnsUpdaterTest, LineCountMismatchLeavesMapUnchanged) {
    EXPECT_CALL(client_, get(_))
        .WillOnce(Return(HttpResponse{200, "good 9.9.9.9\ngood 9.9.9.9"}));

    HostnameIpMap map;
    auto outcome = makeUpdater({})->updateElement(
        entry({"a.example.com", "b.example.com", "c.example.com"}),
        networkInfo("9.9.9.9"), map);

    EXPECT_EQ(outcome, EntryOutcome::Aborted);
    EXPECT_TRUE(map.empty());
}

TEST_F(NoipDnsUpdaterTest, OverrideIsSentAsMyIp) {
    HttpRequest sent;
    EXPECT_CALL(client_, get(_))
        .WillOnce(DoAll(SaveArg<0>(&sent),
                        Return(HttpResponse{200, "good 5.5.5.5"})));

    HostnameIpMap map;
    auto outcome = makeUpdater({})->updateElement(
        entry({"a.example.com"}, "5.5.5.5"), networkInfo("9.9.9.9"), map);

    EXPECT_EQ(outcome, EntryOutcome::Committed);
    EXPECT_EQ(queryValue(sent, "myip"), "5.5.5.5");
    EXPECT_EQ(sent.buildUrl(),
              "https://dynupdate.no-ip.com/nic/"
              "update?hostname=a.example.com&myip=5.5.5.5");
    // The map records the detected address, not the override.
    EXPECT_EQ(map.find(Hostname{"a.example.com"}), IpAddress{"9.9.9.9"});
}

TEST_F(NoipDnsUpdaterTest, OverrideMatchingDetectedIsSkipped) {
    EXPECT_CALL(client_, get(_)).Times(0);

    HostnameIpMap map;
    map.set(Hostname{"a.example.com"}, IpAddress{"1.1.1.1"});
    auto outcome = makeUpdater({})->updateElement(
        entry({"a.example.com"}, "9.9.9.9"), networkInfo("9.9.9.9"), map);

    EXPECT_EQ(outcome, EntryOutcome::Skipped);
}

TEST_F(NoipDnsUpdaterTest, UserErrorKeepsOtherConfirmations) {
    EXPECT_CALL(client_, get(_))
        .WillOnce(Return(HttpResponse{200, "good 9.9.9.9\nnohost"}));

    HostnameIpMap map;
    auto outcome = makeUpdater({})->updateElement(
        entry({"a.example.com", "b.example.com"}), networkInfo("9.9.9.9"), map);

    EXPECT_EQ(outcome, EntryOutcome::UserError);
    EXPECT_EQ(map.find(Hostname{"a.example.com"}), IpAddress{"9.9.9.9"});
    EXPECT_FALSE(map.find(Hostname{"b.example.com"}).has_value());
}

TEST_F(NoipDnsUpdaterTest, ServerErrorAndUnsupportedAreNotRecorded) {
    EXPECT_CALL(client_, get(_))
        .WillOnce(
            Return(HttpResponse{200, "good 9.9.9.9\n911\nsomething new"}));

    HostnameIpMap map;
    auto outcome = makeUpdater({})->updateElement(
        entry({"a.example.com", "b.example.com", "c.example.com"}),
        networkInfo("9.9.9.9"), map);

    EXPECT_EQ(outcome, EntryOutcome::Committed);
    EXPECT_EQ(map.find(Hostname{"a.example.com"}), IpAddress{"9.9.9.9"});
    EXPECT_FALSE(map.find(Hostname{"b.example.com"}).has_value());
    EXPECT_FALSE(map.find(Hostname{"c.example.com"}).has_value());
}

TEST_F(NoipDnsUpdaterTest, NoConfirmedHostnameIsUnconfirmed) {
    EXPECT_CALL(client_, get(_))
        .WillOnce(Return(HttpResponse{200, "911\nsomething new"}));

    HostnameIpMap map;
    auto outcome = makeUpdater({})->updateElement(
        entry({"a.example.com", "b.example.com"}), networkInfo("9.9.9.9"), map);

    EXPECT_EQ(outcome, EntryOutcome::Unconfirmed);
    EXPECT_TRUE(map.empty());
}

TEST_F(NoipDnsUpdaterTest, UnconfirmedEntryIsNotPersisted) {
    EXPECT_CALL(discovery_, getIpAddress())
        .WillOnce(Return(networkInfo("9.9.9.9")));
    EXPECT_CALL(client_, get(_)).WillOnce(Return(HttpResponse{200, "911"}));

    makeUpdater({entry({"a.example.com"})})->update();

    EXPECT_FALSE(database_->get().has_value());
}

TEST_F(NoipDnsUpdaterTest, NonSuccessStatusAbortsEntry) {
    EXPECT_CALL(client_, get(_))
        .WillOnce(Return(HttpResponse{503, "good 9.9.9.9"}))
        .WillOnce(Return(HttpResponse{401, "badauth"}));

    auto updater = makeUpdater({});
    HostnameIpMap map;
    map.set(Hostname{"a.example.com"}, IpAddress{"1.1.1.1"});
    const HostnameIpMap before = map;

    EXPECT_EQ(updater->updateElement(entry({"a.example.com"}),
                                     networkInfo("9.9.9.9"), map),
              EntryOutcome::Aborted);
    EXPECT_EQ(map, before);

    EXPECT_EQ(updater->updateElement(entry({"a.example.com"}),
                                     networkInfo("9.9.9.9"), map),
              EntryOutcome::Aborted);
    EXPECT_EQ(map, before);
}

TEST_F(NoipDnsUpdaterTest, TransportFailureAbortsEntry) {
    EXPECT_CALL(client_, get(_))
        .WillOnce(Throw(ddns::error::CurlRuntimeError(
            __FILE__, __LINE__, "get", "Could not resolve host")));

    HostnameIpMap map;
    auto outcome = makeUpdater({})->updateElement(
        entry({"a.example.com"}), networkInfo("9.9.9.9"), map);

    EXPECT_EQ(outcome, EntryOutcome::Aborted);
    EXPECT_TRUE(map.empty());
}

TEST_F(NoipDnsUpdaterTest, EmptyBodyAbortsEntry) {
    EXPECT_CALL(client_, get(_)).WillOnce(Return(HttpResponse{200, " \r\n"}));

    HostnameIpMap map;
    auto outcome = makeUpdater({})->updateElement(
        entry({"a.example.com"}), networkInfo("9.9.9.9"), map);

    EXPECT_EQ(outcome, EntryOutcome::Aborted);
    EXPECT_TRUE(map.empty());
}

TEST_F(NoipDnsUpdaterTest, UnknownAddressSendsButRecordsNothing) {
    HostnameIpMap existing;
    existing.set(Hostname{"a.example.com"}, IpAddress{"9.9.9.9"});
    ASSERT_TRUE(database_->set(existing));

    EXPECT_CALL(discovery_, getIpAddress())
        .WillOnce(Return(IpAddressInfo::none()));
    EXPECT_CALL(client_, get(_))
        .WillOnce(Return(HttpResponse{200, "good 8.8.8.8"}));

    makeUpdater({entry({"a.example.com"})})->update();

    EXPECT_EQ(storedMap(), existing);
}

TEST_F(NoipDnsUpdaterTest, EntriesAreProcessedInOrderAndPersisted) {
    EXPECT_CALL(discovery_, getIpAddress())
        .WillOnce(Return(networkInfo("9.9.9.9")));

    std::vector<std::string> sentHostnames;
    EXPECT_CALL(client_, get(_))
        .Times(2)
        .WillRepeatedly([&](const HttpRequest &request) {
            sentHostnames.push_back(*queryValue(request, "hostname"));
            if (sentHostnames.size() == 1) {
                return HttpResponse{200, "good 9.9.9.9"};
            }
            return HttpResponse{200, "badauth"};
        });

    auto first = entry({"a.example.com"});
    auto second = entry({"b.example.com"});
    second.username = "other@example.com";
    makeUpdater({first, second})->update();

    ASSERT_EQ(sentHostnames.size(), 2u);
    EXPECT_EQ(sentHostnames[0], "a.example.com");
    EXPECT_EQ(sentHostnames[1], "b.example.com");

    auto map = storedMap();
    EXPECT_EQ(map.size(), 1u);
    EXPECT_EQ(map.find(Hostname{"a.example.com"}), IpAddress{"9.9.9.9"});
}

TEST_F(NoipDnsUpdaterTest, HostnameSharedAcrossEntriesSeesEarlierCommit) {
    EXPECT_CALL(discovery_, getIpAddress())
        .WillOnce(Return(networkInfo("9.9.9.9")));
    EXPECT_CALL(client_, get(_))
        .Times(1)
        .WillOnce(Return(HttpResponse{200, "good 9.9.9.9"}));

    makeUpdater({entry({"a.example.com"}), entry({"a.example.com"})})
        ->update();
}

TEST(UserAgentTest, Format) {
    auto agent = buildUserAgent("1.2.3", "ops@example.com");
    EXPECT_TRUE(agent.starts_with("ddns-updater/"));
    EXPECT_NE(agent.find("-v1.2.3 ops@example.com"), std::string::npos);
    EXPECT_TRUE(agent.ends_with(" ops@example.com"));
}

TEST(UserAgentTest, ContactIsRequired) {
    EXPECT_THROW((void)buildUserAgent("1.2.3", ""),
                 ddns::error::InvalidArgument);
    EXPECT_THROW((void)buildUserAgent("1.2.3", " \t"),
                 ddns::error::InvalidArgument);
}

TEST(EntryOutcomeTest, ToString) {
    EXPECT_STREQ(toString(EntryOutcome::Skipped), "Skipped");
    EXPECT_STREQ(toString(EntryOutcome::Aborted), "Aborted");
    EXPECT_STREQ(toString(EntryOutcome::Unconfirmed), "Unconfirmed");
}
