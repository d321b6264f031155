/*
 * 설명: 연결/재연결마다 SAS 토큰을 갱신하고, 짧은 간격의 재시도에서는 시각 조회를 생략한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: device/tests/unit/reconnect_test.cpp
 */
#include "iothub/reconnect.hpp"

#include "iothub/sas_token.hpp"

namespace iothub {

ReconnectAuthenticator::ReconnectAuthenticator(const DeviceConfig& config, std::shared_ptr<MqttTransport> transport,
                                               TimestampFn timestamp_fn, MonotonicClock clock,
                                               std::shared_ptr<Observability> observability)
    : username_(MqttUsername(config)), resource_uri_(TokenResourceUri(config)), device_key_(config.device_key),
      token_lifetime_seconds_(static_cast<std::int64_t>(config.token_lifetime_minutes) * 60),
      transport_(std::move(transport)), timestamp_fn_(std::move(timestamp_fn)), clock_(std::move(clock)),
      observability_(std::move(observability)) {
  connect_options_.host = HubHostname(config);
  connect_options_.keepalive_seconds = config.keepalive_seconds;
  connect_options_.port = config.port;
  connect_options_.use_tls = true;
  if (!clock_) {
    clock_ = &SteadyClockNow;
  }
}

ReconnectAuthenticator::~ReconnectAuthenticator() {
  if (hook_installed_) {
    transport_->ClearReconnectHook();
  }
}

void ReconnectAuthenticator::Connect() {
  std::string password;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.last_attempt = clock_();
    password = CreateSas(std::nullopt);
  }
  transport_->SetCredentials(username_, password);
  observability_->Log(LogLevel::kInfo, LogContext{"mqtt.connect", std::nullopt, std::nullopt, std::nullopt,
                                                  connect_options_.host + ":" + std::to_string(connect_options_.port)});
  transport_->Connect(connect_options_, [this]() { OnReconnect(); });
  hook_installed_ = true;
}

void ReconnectAuthenticator::OnReconnect() {
  std::string password;
  bool refreshed = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_();
    auto elapsed = now - state_.last_attempt;
    if (elapsed > kTimestampRefreshWindow) {
      password = CreateSas(std::nullopt);
      refreshed = true;
    } else {
      password = CreateSas(std::chrono::duration_cast<std::chrono::seconds>(elapsed).count());
    }
    state_.last_attempt = now;
  }
  observability_->IncrementReconnect();
  observability_->Log(LogLevel::kInfo, LogContext{"mqtt.reconnect", std::nullopt, std::nullopt, std::nullopt,
                                                  refreshed ? "timestamp_refreshed" : "timestamp_extrapolated"});
  transport_->SetCredentials(username_, password);
}

std::string ReconnectAuthenticator::CreateSas(std::optional<std::int64_t> timestamp_diff_seconds) {
  std::int64_t timestamp = timestamp_diff_seconds ? state_.last_timestamp + *timestamp_diff_seconds : timestamp_fn_();
  state_.last_timestamp = timestamp;
  password_ = GenerateSasToken(resource_uri_, device_key_, timestamp + token_lifetime_seconds_);
  observability_->IncrementTokenRefresh();
  return password_;
}

ReconnectState ReconnectAuthenticator::State() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

std::string ReconnectAuthenticator::CurrentPassword() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return password_;
}

}  // namespace iothub
