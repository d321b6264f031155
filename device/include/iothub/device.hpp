/*
 * 설명: IoT Hub 디바이스 세션. 전송 계층을 소유하고 C2D 메시지/다이렉트 메서드/트윈 채널을 분기한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: device/tests/unit/device_dispatch_test.cpp, device/tests/it/device_session_it_test.cpp
 */
#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "iothub/config.hpp"
#include "iothub/observability.hpp"
#include "iothub/reconnect.hpp"
#include "iothub/time_source.hpp"
#include "iothub/topic_codec.hpp"
#include "iothub/transport.hpp"
#include "iothub/twin_correlator.hpp"

namespace iothub {

struct MethodResult {
  int status;
  nlohmann::json body;
};

using BoundCallback = std::function<void(const std::string& payload, const PropertyBag& properties)>;
// 요청 본문이 "null"이거나 비어 있으면 JSON null이 전달된다.
using MethodCallback = std::function<MethodResult(const nlohmann::json& request)>;
// 값을 돌려주면 확인을 기다리지 않고 reported 트윈으로 즉시 보고한다.
using TwinUpdateCallback =
    std::function<std::optional<nlohmann::json>(const nlohmann::json& desired, int version)>;

class Device {
 public:
  Device(const DeviceConfig& config, std::shared_ptr<MqttTransport> transport, TimestampFn timestamp_fn,
         MonotonicClock clock = {}, std::shared_ptr<Observability> observability = nullptr);
  // 등록한 핸들러와 재연결 훅을 전송 계층에서 떼어 낸다. 수신 루프의 전달과 동시에 파괴하면 안 된다.
  ~Device();

  Device(const Device&) = delete;
  Device& operator=(const Device&) = delete;

  void Connect();
  MqttTransport& Mqtt() { return *transport_; }

  // 콜백은 한 개만 유지되며 다시 등록하면 이전 콜백을 대체한다. 구독은 최초 등록 때 한 번만 한다.
  void OnBound(BoundCallback callback);
  void OnMethod(const std::string& method_name, MethodCallback callback);
  void OnTwinUpdate(TwinUpdateCallback callback);

  std::optional<int> ReportTwin(const nlohmann::json& reported, bool wait_confirm = true,
                                std::chrono::milliseconds timeout = kDefaultTwinTimeout);
  TwinResult GetTwin(std::chrono::milliseconds timeout = kDefaultTwinTimeout);
  void PublishEvent(const nlohmann::json& event, const PropertyBag& properties);

  const DeviceConfig& GetConfig() const { return config_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }
  ReconnectAuthenticator& GetAuthenticator() { return *authenticator_; }

 private:
  bool IsBound(const MqttMessage& message) const;
  static bool IsMethod(const MqttMessage& message);
  static bool IsTwinUpdate(const MqttMessage& message);

  void HandleBound(const MqttMessage& message);
  void HandleMethod(const MqttMessage& message);
  void HandleTwinUpdate(const MqttMessage& message);

  TwinCorrelator& Twin();

  DeviceConfig config_;
  std::string bound_prefix_;
  std::shared_ptr<MqttTransport> transport_;
  std::shared_ptr<Observability> observability_;
  std::unique_ptr<ReconnectAuthenticator> authenticator_;
  std::optional<BoundCallback> bound_callback_;
  std::optional<std::unordered_map<std::string, MethodCallback>> method_table_;
  std::optional<TwinUpdateCallback> twin_callback_;
  std::unique_ptr<TwinCorrelator> correlator_;
  std::vector<HandlerId> handler_ids_;
  std::mutex registration_mutex_;
  std::mutex correlator_mutex_;
};

}  // namespace iothub
