// Basic tests for value types and their string forms.
#include "kefctl/kefctl.h"

#include <gtest/gtest.h>

TEST(BasicTest, ErrorCodeNames) {
  EXPECT_STREQ(kefctl::ErrorCodeName(kefctl::ErrorCode::kNone), "None");
  EXPECT_STREQ(kefctl::ErrorCodeName(kefctl::ErrorCode::kNoHostConfigured),
               "NoHostConfigured");
  EXPECT_STREQ(kefctl::ErrorCodeName(kefctl::ErrorCode::kTimeout), "Timeout");
  EXPECT_STREQ(kefctl::ErrorCodeName(kefctl::ErrorCode::kNoDeviceFound), "NoDeviceFound");
}

TEST(BasicTest, ErrorToStringIncludesMessage) {
  kefctl::Error error;
  EXPECT_TRUE(error.ok());
  EXPECT_EQ(error.ToString(), "None");

  error = kefctl::Error{kefctl::ErrorCode::kTransportError, "HTTP error: 500"};
  EXPECT_FALSE(error.ok());
  EXPECT_EQ(error.ToString(), "TransportError: HTTP error: 500");
}

TEST(BasicTest, DeviceAddressToString) {
  kefctl::DeviceAddress address{"192.168.1.37", std::nullopt};
  EXPECT_EQ(address.ToString(), "192.168.1.37");
  address.port = 8080;
  EXPECT_EQ(address.ToString(), "192.168.1.37:8080");
  EXPECT_FALSE(address.empty());
  EXPECT_TRUE(kefctl::DeviceAddress{}.empty());
}

TEST(BasicTest, DeviceAddressEquality) {
  const kefctl::DeviceAddress a{"10.0.0.2", std::nullopt};
  const kefctl::DeviceAddress b{"10.0.0.2", std::nullopt};
  const kefctl::DeviceAddress c{"10.0.0.2", 80};
  EXPECT_EQ(a, b);
  EXPECT_NE(a, c);
}

TEST(BasicTest, DiscoveryResultFactories) {
  const auto found = kefctl::DiscoveryResult::Found({"10.0.0.5", std::nullopt}, "ssdp");
  EXPECT_TRUE(found.ok());
  EXPECT_TRUE(found.error.ok());
  EXPECT_EQ(found.strategy, "ssdp");

  const auto failed = kefctl::DiscoveryResult::Failed(
      kefctl::ErrorCode::kTimeout, "network scan timeout", "sweep");
  EXPECT_FALSE(failed.ok());
  EXPECT_EQ(failed.error.code, kefctl::ErrorCode::kTimeout);
  EXPECT_EQ(failed.error.message, "network scan timeout");
}

TEST(BasicTest, EmptyDeviceStateDefaults) {
  kefctl::DeviceState state;
  EXPECT_FALSE(state.connected);
  EXPECT_FALSE(state.powered_on);
  EXPECT_EQ(state.port, kefctl::kDefaultHttpPort);
  EXPECT_FALSE(state.playback.has_value());
}

TEST(BasicTest, LogLevelNames) {
  EXPECT_STREQ(kefctl::LogLevelName(kefctl::LogLevel::kInfo), "info");
  EXPECT_STREQ(kefctl::LogLevelName(kefctl::LogLevel::kWarning), "warning");
  EXPECT_STREQ(kefctl::LogLevelName(kefctl::LogLevel::kError), "error");
}
