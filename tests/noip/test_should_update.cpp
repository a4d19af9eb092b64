#include <gtest/gtest.h>

#include <optional>

#include "ddns/noip/updater.hpp"

using namespace ddns::noip;

namespace {

const std::optional<IpAddress> NONE;
const std::optional<IpAddress> A = IpAddress{"1.1.1.1"};
const std::optional<IpAddress> B = IpAddress{"2.2.2.2"};

auto shouldUpdate(const std::optional<IpAddress> &detected,
                  const std::optional<IpAddress> &stored,
                  const std::optional<IpAddress> &desired) -> bool {
    return NoipDnsUpdater::shouldUpdate(detected, stored, desired);
}

}  // namespace

TEST(ShouldUpdateTest, UnknownDetectedAlwaysUpdates) {
    EXPECT_TRUE(shouldUpdate(NONE, NONE, NONE));
    EXPECT_TRUE(shouldUpdate(NONE, A, NONE));
    EXPECT_TRUE(shouldUpdate(NONE, A, A));
}

TEST(ShouldUpdateTest, UnknownStoredAlwaysUpdates) {
    EXPECT_TRUE(shouldUpdate(A, NONE, NONE));
    EXPECT_TRUE(shouldUpdate(A, NONE, A));
}

TEST(ShouldUpdateTest, WithoutOverrideComparesDetectedWithStored) {
    EXPECT_FALSE(shouldUpdate(A, A, NONE));
    EXPECT_TRUE(shouldUpdate(A, B, NONE));
}

TEST(ShouldUpdateTest, WithOverrideComparesDesiredWithDetected) {
    EXPECT_FALSE(shouldUpdate(A, A, A));
    EXPECT_TRUE(shouldUpdate(A, A, B));
    // The stored value is not consulted once an override is set.
    EXPECT_FALSE(shouldUpdate(A, B, A));
    EXPECT_TRUE(shouldUpdate(B, A, A));
}
