#include <cstdlib>

#include <gtest/gtest.h>

#include "iothub/config.hpp"
#include "iothub/errors.hpp"

namespace {

iothub::DeviceConfig ValidConfig() {
  iothub::DeviceConfig cfg;
  cfg.hub_id = "my-hub";
  cfg.device_id = "my-device";
  cfg.api_version = "2017-06-30";
  cfg.device_key = "ZhmdoNjyBccLrTnku0JxxVTTg8e94kleWTz9M+FJ9dk=";
  return cfg;
}

TEST(ConfigTest, DerivesHubEndpointsFromIdentity) {
  auto cfg = ValidConfig();
  EXPECT_EQ(iothub::HubHostname(cfg), "my-hub.azure-devices.net");
  EXPECT_EQ(iothub::MqttUsername(cfg), "my-hub.azure-devices.net/my-device/api-version=2017-06-30");
  EXPECT_EQ(iothub::TokenResourceUri(cfg), "my-hub.azure-devices.net/devices");
}

TEST(ConfigTest, MissingIdentityFieldsAreRejected) {
  EXPECT_NO_THROW(iothub::ValidateConfig(ValidConfig()));

  auto no_hub = ValidConfig();
  no_hub.hub_id.clear();
  EXPECT_THROW(iothub::ValidateConfig(no_hub), iothub::ConfigError);

  auto no_device = ValidConfig();
  no_device.device_id.clear();
  EXPECT_THROW(iothub::ValidateConfig(no_device), iothub::ConfigError);

  auto no_key = ValidConfig();
  no_key.device_key.clear();
  EXPECT_THROW(iothub::ValidateConfig(no_key), iothub::ConfigError);

  auto zero_lifetime = ValidConfig();
  zero_lifetime.token_lifetime_minutes = 0;
  EXPECT_THROW(iothub::ValidateConfig(zero_lifetime), iothub::ConfigError);
}

TEST(ConfigTest, MalformedKeyIsRejected) {
  auto cfg = ValidConfig();
  cfg.device_key = "not base64";
  EXPECT_THROW(iothub::ValidateConfig(cfg), iothub::ConfigError);
}

TEST(ConfigTest, MalformedTimeJsonPointerIsRejected) {
  auto escaped = ValidConfig();
  escaped.time_json_pointer = "/a~2";
  EXPECT_THROW(iothub::ValidateConfig(escaped), iothub::ConfigError);

  auto relative = ValidConfig();
  relative.time_json_pointer = "now/epoch";
  EXPECT_THROW(iothub::ValidateConfig(relative), iothub::ConfigError);

  auto escaped_ok = ValidConfig();
  escaped_ok.time_json_pointer = "/a~1b/~0c";
  EXPECT_NO_THROW(iothub::ValidateConfig(escaped_ok));
}

TEST(ConfigTest, LoadsFromEnvironmentWithDefaults) {
  setenv("IOTHUB_HUB_ID", "env-hub", 1);
  setenv("IOTHUB_DEVICE_ID", "env-device", 1);
  setenv("IOTHUB_DEVICE_KEY", "YWJjZA==", 1);
  setenv("IOTHUB_TOKEN_LIFETIME_MINUTES", "15", 1);
  unsetenv("IOTHUB_API_VERSION");
  unsetenv("IOTHUB_PORT");
  unsetenv("IOTHUB_TIME_URL");

  auto cfg = iothub::LoadConfigFromEnv();
  EXPECT_EQ(cfg.hub_id, "env-hub");
  EXPECT_EQ(cfg.device_id, "env-device");
  EXPECT_EQ(cfg.device_key, "YWJjZA==");
  EXPECT_EQ(cfg.token_lifetime_minutes, 15u);
  EXPECT_EQ(cfg.api_version, "2017-06-30");
  EXPECT_EQ(cfg.port, 8883);
  EXPECT_TRUE(cfg.time_url.empty());
  EXPECT_NO_THROW(iothub::ValidateConfig(cfg));

  setenv("IOTHUB_TOKEN_LIFETIME_MINUTES", "soon", 1);
  EXPECT_THROW(iothub::LoadConfigFromEnv(), iothub::ConfigError);
  unsetenv("IOTHUB_TOKEN_LIFETIME_MINUTES");
}

}  // namespace
