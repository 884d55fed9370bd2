#include <muxbus/detail/config.hpp>
#include <muxbus/client.hpp>
#include <gtest/gtest.h>

using namespace muxbus;
using namespace std::chrono_literals;

TEST(ConfigTest, Defaults) {
    // Test: Built-in bundler defaults
    BundlerConfig config;
    EXPECT_EQ(config.every, 16ms);
    EXPECT_EQ(config.max_packets, 2048u);
    EXPECT_TRUE(config.IsValid());
}

TEST(ConfigTest, NormalizeEvery) {
    // Test: 0ms should clamp to 1ms
    BundlerConfig config1;
    config1.every = 0ms;
    EXPECT_EQ(config1.Normalize().every, 1ms);

    // Test: 250ms should stay 250ms
    BundlerConfig config2;
    config2.every = 250ms;
    EXPECT_EQ(config2.Normalize().every, 250ms);

    // Test: Ten minutes should clamp to one minute
    BundlerConfig config3;
    config3.every = 600'000ms;
    EXPECT_EQ(config3.Normalize().every, 60'000ms);
}

TEST(ConfigTest, NormalizeMaxPackets) {
    BundlerConfig config1;
    config1.max_packets = 0;  // Below minimum
    EXPECT_EQ(config1.Normalize().max_packets, 1u);

    BundlerConfig config2;
    config2.max_packets = 5'000'000;  // Above maximum
    EXPECT_EQ(config2.Normalize().max_packets, 1'048'576u);
}

TEST(ConfigTest, IsValidRanges) {
    BundlerConfig config1;
    config1.every = 0ms;
    EXPECT_FALSE(config1.IsValid());

    BundlerConfig config2;
    config2.max_packets = 0;
    EXPECT_FALSE(config2.IsValid());

    // Test: Normalized configs are always valid
    EXPECT_TRUE(config1.Normalize().IsValid());
    EXPECT_TRUE(config2.Normalize().IsValid());
}

TEST(ConfigTest, MergeOverridesOnlySetFields) {
    BundlerConfig base;
    base.every = 20ms;
    base.max_packets = 100;

    // Test: Nothing set keeps the base
    auto unchanged = base.Merge({});
    EXPECT_EQ(unchanged.every, 20ms);
    EXPECT_EQ(unchanged.max_packets, 100u);

    // Test: Only `every` overridden
    auto faster = base.Merge({.every = 5ms});
    EXPECT_EQ(faster.every, 5ms);
    EXPECT_EQ(faster.max_packets, 100u);

    // Test: Only `max_packets` overridden
    auto smaller = base.Merge({.max_packets = 3});
    EXPECT_EQ(smaller.every, 20ms);
    EXPECT_EQ(smaller.max_packets, 3u);
}

TEST(ConfigTest, ClientConfigValidation) {
    ClientConfig config;
    EXPECT_TRUE(config.IsValid());
    EXPECT_EQ(config.hostname, "0.0.0.0");
    EXPECT_EQ(config.port, 3000);
    EXPECT_EQ(config.adapter, "inproc");
    EXPECT_EQ(config.encoder, "binary");
    EXPECT_FALSE(config.stats);

    ClientConfig no_host;
    no_host.hostname.clear();
    EXPECT_FALSE(no_host.IsValid());

    ClientConfig no_adapter;
    no_adapter.adapter.clear();
    EXPECT_FALSE(no_adapter.IsValid());

    ClientConfig no_encoder;
    no_encoder.encoder.clear();
    EXPECT_FALSE(no_encoder.IsValid());
}

TEST(ConfigTest, ErrorNames) {
    EXPECT_STREQ(ToString(ClientError::Success), "Success");
    EXPECT_STREQ(ToString(ClientError::UnknownAdapter), "UnknownAdapter");
    EXPECT_STREQ(ToString(ClientError::UnknownEncoder), "UnknownEncoder");
    EXPECT_STREQ(ToString(ClientError::InvalidConfig), "InvalidConfig");
    EXPECT_STREQ(ToString(ClientError::AllocationFailed), "AllocationFailed");
}
