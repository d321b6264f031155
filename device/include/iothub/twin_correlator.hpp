/*
 * 설명: 트윈 get/report 요청에 요청 ID를 부여하고 허브 응답과 짝지어 호출자를 깨운다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: device/tests/unit/twin_correlator_test.cpp, device/tests/it/device_session_it_test.cpp
 */
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "iothub/observability.hpp"
#include "iothub/transport.hpp"

namespace iothub {

constexpr std::chrono::milliseconds kWaitForever{-1};
constexpr std::chrono::milliseconds kDefaultTwinTimeout{1000};

struct TwinResult {
  int status;
  std::optional<nlohmann::json> twin;
};

// 동시에 하나의 요청만 진행된다. 뒤이은 호출자는 앞선 요청이 끝나거나 타임아웃될 때까지 대기한다.
class TwinCorrelator {
 public:
  TwinCorrelator(std::shared_ptr<MqttTransport> transport, std::shared_ptr<Observability> observability);
  ~TwinCorrelator();

  TwinCorrelator(const TwinCorrelator&) = delete;
  TwinCorrelator& operator=(const TwinCorrelator&) = delete;

  // wait_confirm이 false면 요청 가드를 잡지 않고 발행 직후 반환하므로 수신 루프 안에서도 호출할 수 있다.
  // 이때 쓰인 요청 ID는 진행 중인 요청으로 등록되지 않으며 그 응답은 폐기된다.
  // wait_confirm이 true인 호출과 Get은 수신 루프 컨텍스트에서 하면 안 된다.
  std::optional<int> Report(const nlohmann::json& reported, bool wait_confirm, std::chrono::milliseconds timeout);
  TwinResult Get(std::chrono::milliseconds timeout);

  void HandleResponse(const MqttMessage& message);
  static bool IsResponse(const MqttMessage& message);

  std::optional<std::int64_t> OutstandingRequestId() const;
  std::int64_t LastRequestId() const;

 private:
  struct ResponseSlot {
    int status{0};
    std::string payload;
  };

  std::int64_t NextRequestId(bool outstanding);
  ResponseSlot AwaitResponse(std::int64_t request_id, std::chrono::milliseconds timeout);

  std::shared_ptr<MqttTransport> transport_;
  std::shared_ptr<Observability> observability_;
  HandlerId handler_id_{0};
  std::mutex request_mutex_;
  mutable std::mutex state_mutex_;
  std::condition_variable arrived_cv_;
  bool arrived_{false};
  std::int64_t request_id_{-1};
  std::optional<std::int64_t> outstanding_id_;
  ResponseSlot slot_;
};

}  // namespace iothub
