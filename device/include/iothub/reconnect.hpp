/*
 * 설명: 최초 연결과 매 재연결 시점에 SAS 토큰을 다시 만들어 MQTT 비밀번호로 설치한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: device/tests/unit/reconnect_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "iothub/config.hpp"
#include "iothub/observability.hpp"
#include "iothub/time_source.hpp"
#include "iothub/transport.hpp"

namespace iothub {

// 이 간격 이내의 재연결 시도는 외부 시각 공급원을 다시 조회하지 않고 경과 시간으로 보정한다.
constexpr std::chrono::milliseconds kTimestampRefreshWindow{10000};

struct ReconnectState {
  std::chrono::milliseconds last_attempt{0};
  std::int64_t last_timestamp{0};
};

class ReconnectAuthenticator {
 public:
  ReconnectAuthenticator(const DeviceConfig& config, std::shared_ptr<MqttTransport> transport,
                         TimestampFn timestamp_fn, MonotonicClock clock,
                         std::shared_ptr<Observability> observability);
  ~ReconnectAuthenticator();

  ReconnectAuthenticator(const ReconnectAuthenticator&) = delete;
  ReconnectAuthenticator& operator=(const ReconnectAuthenticator&) = delete;

  void Connect();
  // 전송 계층의 재연결 훅. 수신 루프 컨텍스트에서 호출된다.
  void OnReconnect();

  ReconnectState State() const;
  std::string CurrentPassword() const;

 private:
  std::string CreateSas(std::optional<std::int64_t> timestamp_diff_seconds);

  std::string username_;
  std::string resource_uri_;
  std::string device_key_;
  std::int64_t token_lifetime_seconds_;
  ConnectOptions connect_options_;
  std::shared_ptr<MqttTransport> transport_;
  TimestampFn timestamp_fn_;
  MonotonicClock clock_;
  std::shared_ptr<Observability> observability_;
  ReconnectState state_;
  std::string password_;
  bool hook_installed_{false};
  mutable std::mutex mutex_;
};

}  // namespace iothub
