/*
 * 설명: 환경설정을 읽어 MQTT 접속 정보와 새 SAS 토큰을 출력하는 진입점.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: device/tests/unit/sas_token_test.cpp, device/tests/unit/config_test.cpp
 */
#include <cstdint>
#include <iostream>

#include <nlohmann/json.hpp>

#include "iothub/config.hpp"
#include "iothub/errors.hpp"
#include "iothub/sas_token.hpp"
#include "iothub/time_source.hpp"

int main() {
  using namespace iothub;
  try {
    DeviceConfig config = LoadConfigFromEnv();
    ValidateConfig(config);
    auto timestamp_fn = MakeTimestampFn(config.time_url, config.time_json_pointer);
    auto timestamp = timestamp_fn();
    auto expiry = timestamp + static_cast<std::int64_t>(config.token_lifetime_minutes) * 60;

    nlohmann::json out;
    out["host"] = HubHostname(config);
    out["port"] = config.port;
    out["clientId"] = config.device_id;
    out["username"] = MqttUsername(config);
    out["password"] = GenerateSasToken(TokenResourceUri(config), config.device_key, expiry);
    out["expiresAt"] = expiry;
    std::cout << out.dump(2) << "\n";
  } catch (const ConfigError& ex) {
    std::cerr << "설정 오류: " << ex.what() << "\n";
    return 2;
  } catch (const TimeSourceError& ex) {
    std::cerr << "시각 조회 실패: " << ex.what() << "\n";
    return 3;
  }
  return 0;
}
