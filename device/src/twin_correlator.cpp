/*
 * 설명: 트윈 요청/응답 상관관계와 타임아웃 대기를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: device/tests/unit/twin_correlator_test.cpp, device/tests/it/device_session_it_test.cpp
 */
#include "iothub/twin_correlator.hpp"

#include "iothub/errors.hpp"
#include "iothub/topic_codec.hpp"

namespace iothub {

TwinCorrelator::TwinCorrelator(std::shared_ptr<MqttTransport> transport, std::shared_ptr<Observability> observability)
    : transport_(std::move(transport)), observability_(std::move(observability)) {
  transport_->Subscribe({{TwinResponseTopicFilter(), 0}});
  handler_id_ = transport_->On(
      TransportEvent::kPublish, [this](const MqttMessage& message) { HandleResponse(message); }, &IsResponse);
}

TwinCorrelator::~TwinCorrelator() { transport_->Off(handler_id_); }

bool TwinCorrelator::IsResponse(const MqttMessage& message) { return HasPrefix(message.topic, kTwinResponsePrefix); }

std::int64_t TwinCorrelator::NextRequestId(bool outstanding) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  ++request_id_;
  if (outstanding) {
    outstanding_id_ = request_id_;
    arrived_ = false;
  }
  return request_id_;
}

std::optional<int> TwinCorrelator::Report(const nlohmann::json& reported, bool wait_confirm,
                                          std::chrono::milliseconds timeout) {
  if (!wait_confirm) {
    auto request_id = NextRequestId(false);
    transport_->Publish(TwinReportedTopic(request_id), reported.dump());
    observability_->IncrementPublished();
    return std::nullopt;
  }
  std::lock_guard<std::mutex> guard(request_mutex_);
  auto request_id = NextRequestId(true);
  transport_->Publish(TwinReportedTopic(request_id), reported.dump());
  observability_->IncrementPublished();
  return AwaitResponse(request_id, timeout).status;
}

TwinResult TwinCorrelator::Get(std::chrono::milliseconds timeout) {
  std::lock_guard<std::mutex> guard(request_mutex_);
  auto request_id = NextRequestId(true);
  transport_->Publish(TwinGetTopic(request_id), std::nullopt);
  observability_->IncrementPublished();
  auto response = AwaitResponse(request_id, timeout);
  TwinResult result{response.status, std::nullopt};
  if (response.status == 200) {
    auto twin = nlohmann::json::parse(response.payload, nullptr, false);
    if (twin.is_discarded()) {
      throw ProtocolError("트윈 응답이 JSON이 아닙니다", TwinGetTopic(request_id));
    }
    result.twin = std::move(twin);
  }
  return result;
}

TwinCorrelator::ResponseSlot TwinCorrelator::AwaitResponse(std::int64_t request_id,
                                                           std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(state_mutex_);
  bool arrived = true;
  if (timeout == kWaitForever) {
    arrived_cv_.wait(lock, [this]() { return arrived_; });
  } else {
    arrived = arrived_cv_.wait_for(lock, timeout, [this]() { return arrived_; });
  }
  outstanding_id_.reset();
  if (!arrived) {
    lock.unlock();
    observability_->IncrementTimeout();
    observability_->Log(LogLevel::kWarn, LogContext{"twin.timeout", std::nullopt, request_id, std::nullopt,
                                                    std::to_string(timeout.count()) + "ms"});
    throw TimeoutError("트윈 응답 대기 시간이 초과되었습니다", request_id);
  }
  return slot_;
}

void TwinCorrelator::HandleResponse(const MqttMessage& message) {
  auto response = ParseTwinResponseTopic(message.topic);
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (outstanding_id_ && *outstanding_id_ == response.request_id && !arrived_) {
      slot_.status = response.status;
      slot_.payload = message.payload;
      arrived_ = true;
      arrived_cv_.notify_all();
      return;
    }
  }
  observability_->IncrementStale();
  observability_->Log(LogLevel::kDebug,
                      LogContext{"twin.stale_response", message.topic, response.request_id, response.status,
                                 std::nullopt});
}

std::optional<std::int64_t> TwinCorrelator::OutstandingRequestId() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return outstanding_id_;
}

std::int64_t TwinCorrelator::LastRequestId() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return request_id_;
}

}  // namespace iothub
