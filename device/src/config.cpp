/*
 * 설명: 환경 변수에서 디바이스 설정을 읽고 검증한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: device/tests/unit/config_test.cpp
 */
#include "iothub/config.hpp"

#include <cstdlib>

#include "iothub/errors.hpp"
#include "iothub/sas_token.hpp"
#include "iothub/time_source.hpp"

namespace iothub {

namespace {
std::size_t ParseUnsigned(const std::string& key, const std::string& value) {
  try {
    std::size_t idx = 0;
    auto parsed = std::stoul(value, &idx);
    if (idx != value.size()) {
      throw ConfigError(key + " 값이 정수가 아닙니다: " + value);
    }
    return parsed;
  } catch (const std::logic_error&) {
    throw ConfigError(key + " 값이 정수가 아닙니다: " + value);
  }
}
}  // namespace

DeviceConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };

  DeviceConfig cfg;
  cfg.hub_id = get_env("IOTHUB_HUB_ID", "");
  cfg.device_id = get_env("IOTHUB_DEVICE_ID", "");
  cfg.api_version = get_env("IOTHUB_API_VERSION", "2017-06-30");
  cfg.device_key = get_env("IOTHUB_DEVICE_KEY", "");
  cfg.token_lifetime_minutes = ParseUnsigned("IOTHUB_TOKEN_LIFETIME_MINUTES",
                                             get_env("IOTHUB_TOKEN_LIFETIME_MINUTES", "60"));
  cfg.keepalive_seconds = static_cast<unsigned short>(
      ParseUnsigned("IOTHUB_KEEPALIVE_SECONDS", get_env("IOTHUB_KEEPALIVE_SECONDS", "60")));
  cfg.port = static_cast<unsigned short>(ParseUnsigned("IOTHUB_PORT", get_env("IOTHUB_PORT", "8883")));
  cfg.time_url = get_env("IOTHUB_TIME_URL", "");
  cfg.time_json_pointer = get_env("IOTHUB_TIME_JSON_POINTER", "/now/epoch");
  cfg.log_level = get_env("LOG_LEVEL", "info");
  return cfg;
}

void ValidateConfig(const DeviceConfig& config) {
  if (config.hub_id.empty()) {
    throw ConfigError("hub_id가 필요합니다");
  }
  if (config.device_id.empty()) {
    throw ConfigError("device_id가 필요합니다");
  }
  if (config.api_version.empty()) {
    throw ConfigError("api_version이 필요합니다");
  }
  if (config.device_key.empty()) {
    throw ConfigError("device_key가 필요합니다");
  }
  if (config.token_lifetime_minutes == 0) {
    throw ConfigError("token_lifetime_minutes는 0보다 커야 합니다");
  }
  ValidateJsonPointer(config.time_json_pointer);
  DecodeBase64Key(config.device_key);
}

std::string HubHostname(const DeviceConfig& config) { return config.hub_id + kHubDomainSuffix; }

std::string MqttUsername(const DeviceConfig& config) {
  return HubHostname(config) + "/" + config.device_id + "/api-version=" + config.api_version;
}

std::string TokenResourceUri(const DeviceConfig& config) { return HubHostname(config) + "/devices"; }

}  // namespace iothub
