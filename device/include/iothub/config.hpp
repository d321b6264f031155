/*
 * 설명: 디바이스 식별 정보와 연결/토큰/로그 설정 로딩을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: device/tests/unit/config_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace iothub {

constexpr const char* kHubDomainSuffix = ".azure-devices.net";

struct DeviceConfig {
  std::string hub_id;
  std::string device_id;
  std::string api_version{"2017-06-30"};
  std::string device_key;
  std::size_t token_lifetime_minutes{60};
  unsigned short keepalive_seconds{60};
  unsigned short port{8883};
  std::string time_url;
  std::string time_json_pointer{"/now/epoch"};
  std::string log_level{"info"};
};

DeviceConfig LoadConfigFromEnv();

// 필수 항목 누락, 잘못된 base64 키, 0 이하의 토큰 수명은 ConfigError로 즉시 실패한다.
void ValidateConfig(const DeviceConfig& config);

std::string HubHostname(const DeviceConfig& config);
std::string MqttUsername(const DeviceConfig& config);
std::string TokenResourceUri(const DeviceConfig& config);

}  // namespace iothub
