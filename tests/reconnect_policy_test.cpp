#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "net/reconnect_policy.hpp"

using Net::ReconnectPolicy;
using std::chrono::milliseconds;

TEST(ReconnectPolicy, DoublesFromBaseUpToCap) {
    ReconnectPolicy p{ true, 10, 1000, 30000 };
    EXPECT_EQ(p.nextDelay(1), milliseconds(2000));
    EXPECT_EQ(p.nextDelay(2), milliseconds(4000));
    EXPECT_EQ(p.nextDelay(4), milliseconds(16000));
    EXPECT_EQ(p.nextDelay(5), milliseconds(30000));
    EXPECT_EQ(p.nextDelay(1000), milliseconds(30000));
}

TEST(ReconnectPolicy, AttemptWindow) {
    ReconnectPolicy p{ true, 3, 100, 1000 };
    EXPECT_FALSE(p.shouldRetry(0));
    EXPECT_TRUE(p.shouldRetry(1));
    EXPECT_TRUE(p.shouldRetry(3));
    EXPECT_FALSE(p.shouldRetry(4));

    p.enabled = false;
    EXPECT_FALSE(p.shouldRetry(1));
}

TEST(ReconnectPolicy, DegenerateValues) {
    ReconnectPolicy zero{ true, 1, 0, 1000 };
    EXPECT_EQ(zero.nextDelay(3), milliseconds(0));

    ReconnectPolicy negative{ true, 1, -5, -5 };
    EXPECT_EQ(negative.nextDelay(1), milliseconds(0));
}

TEST(ReconnectPolicy, JsonKeepsDefaultsForMissingKeys) {
    ReconnectPolicy defaults{ false, 5, 1000, 30000 };
    auto p = Net::reconnectPolicyFromJson(nlohmann::json{ {"enabled", true}, {"max_delay_ms", 8000} }, defaults);
    EXPECT_TRUE(p.enabled);
    EXPECT_EQ(p.maxAttempts, 5);
    EXPECT_EQ(p.baseDelayMs, 1000);
    EXPECT_EQ(p.maxDelayMs, 8000);

    auto same = Net::reconnectPolicyFromJson(nlohmann::json("nonsense"), defaults);
    EXPECT_FALSE(same.enabled);
}
