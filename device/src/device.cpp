/*
 * 설명: 채널별 predicate/핸들러로 수신 메시지를 분기하고 트윈/이벤트 발행을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: device/tests/unit/device_dispatch_test.cpp, device/tests/it/device_session_it_test.cpp
 */
#include "iothub/device.hpp"

#include "iothub/errors.hpp"

namespace iothub {

namespace {
nlohmann::json ParseDocument(const MqttMessage& message) {
  if (message.payload.empty() || message.payload == "null") {
    return nullptr;
  }
  auto document = nlohmann::json::parse(message.payload, nullptr, false);
  if (document.is_discarded()) {
    throw ProtocolError("페이로드가 JSON이 아닙니다", message.topic);
  }
  return document;
}
}  // namespace

Device::Device(const DeviceConfig& config, std::shared_ptr<MqttTransport> transport, TimestampFn timestamp_fn,
               MonotonicClock clock, std::shared_ptr<Observability> observability)
    : config_(config), bound_prefix_(BoundTopicPrefix(config.device_id)), transport_(std::move(transport)),
      observability_(std::move(observability)) {
  ValidateConfig(config_);
  if (!transport_) {
    throw ConfigError("MQTT 전송 계층이 필요합니다");
  }
  if (!timestamp_fn) {
    throw ConfigError("타임스탬프 공급 함수가 필요합니다");
  }
  if (!observability_) {
    observability_ = std::make_shared<Observability>(ParseLogLevel(config_.log_level));
  }
  authenticator_ = std::make_unique<ReconnectAuthenticator>(config_, transport_, std::move(timestamp_fn),
                                                            std::move(clock), observability_);
}

Device::~Device() {
  std::lock_guard<std::mutex> lock(registration_mutex_);
  for (auto id : handler_ids_) {
    transport_->Off(id);
  }
}

void Device::Connect() { authenticator_->Connect(); }

bool Device::IsBound(const MqttMessage& message) const { return HasPrefix(message.topic, bound_prefix_); }

bool Device::IsMethod(const MqttMessage& message) { return HasPrefix(message.topic, kMethodPostPrefix); }

bool Device::IsTwinUpdate(const MqttMessage& message) { return HasPrefix(message.topic, kTwinDesiredPrefix); }

void Device::OnBound(BoundCallback callback) {
  std::lock_guard<std::mutex> lock(registration_mutex_);
  if (!bound_callback_) {
    transport_->Subscribe({{BoundTopicFilter(config_.device_id), 0}});
    handler_ids_.push_back(transport_->On(
        TransportEvent::kPublish, [this](const MqttMessage& message) { HandleBound(message); },
        [this](const MqttMessage& message) { return IsBound(message); }));
  }
  bound_callback_ = std::move(callback);
}

void Device::OnMethod(const std::string& method_name, MethodCallback callback) {
  std::lock_guard<std::mutex> lock(registration_mutex_);
  if (!method_table_) {
    transport_->Subscribe({{MethodTopicFilter(), 0}});
    handler_ids_.push_back(transport_->On(
        TransportEvent::kPublish, [this](const MqttMessage& message) { HandleMethod(message); }, &IsMethod));
    method_table_.emplace();
  }
  (*method_table_)[method_name] = std::move(callback);
}

void Device::OnTwinUpdate(TwinUpdateCallback callback) {
  std::lock_guard<std::mutex> lock(registration_mutex_);
  if (!twin_callback_) {
    transport_->Subscribe({{TwinDesiredTopicFilter(), 0}});
    handler_ids_.push_back(transport_->On(
        TransportEvent::kPublish, [this](const MqttMessage& message) { HandleTwinUpdate(message); }, &IsTwinUpdate));
  }
  twin_callback_ = std::move(callback);
}

void Device::HandleBound(const MqttMessage& message) {
  observability_->IncrementReceived();
  auto properties = DecodeTrailingSegment(message.topic);
  BoundCallback callback;
  {
    std::lock_guard<std::mutex> lock(registration_mutex_);
    callback = *bound_callback_;
  }
  callback(message.payload, properties);
}

void Device::HandleMethod(const MqttMessage& message) {
  observability_->IncrementReceived();
  auto invocation = ParseMethodTopic(message.topic);
  auto request = ParseDocument(message);
  MethodCallback callback;
  {
    std::lock_guard<std::mutex> lock(registration_mutex_);
    auto it = method_table_->find(invocation.method_name);
    if (it != method_table_->end()) {
      callback = it->second;
    }
  }
  if (!callback) {
    observability_->Log(LogLevel::kError, LogContext{"method.unknown", message.topic, std::nullopt, std::nullopt,
                                                     invocation.method_name});
    throw UnknownMethodError(invocation.method_name, invocation.request_id, message.topic);
  }
  auto result = callback(request);
  transport_->Publish(MethodResponseTopic(result.status, invocation.request_id), result.body.dump());
  observability_->IncrementPublished();
  observability_->Log(LogLevel::kDebug, LogContext{"method.responded", message.topic, std::nullopt, result.status,
                                                   invocation.method_name});
}

void Device::HandleTwinUpdate(const MqttMessage& message) {
  observability_->IncrementReceived();
  auto version = ParseDesiredVersion(message.topic);
  auto desired = ParseDocument(message);
  TwinUpdateCallback callback;
  {
    std::lock_guard<std::mutex> lock(registration_mutex_);
    callback = *twin_callback_;
  }
  auto reported = callback(desired, version);
  if (reported && !reported->is_null()) {
    // 수신 루프 안이므로 확인을 기다리면 응답 전달이 막힌다.
    Twin().Report(*reported, false, kWaitForever);
  }
}

TwinCorrelator& Device::Twin() {
  std::lock_guard<std::mutex> lock(correlator_mutex_);
  if (!correlator_) {
    correlator_ = std::make_unique<TwinCorrelator>(transport_, observability_);
  }
  return *correlator_;
}

std::optional<int> Device::ReportTwin(const nlohmann::json& reported, bool wait_confirm,
                                      std::chrono::milliseconds timeout) {
  return Twin().Report(reported, wait_confirm, timeout);
}

TwinResult Device::GetTwin(std::chrono::milliseconds timeout) { return Twin().Get(timeout); }

void Device::PublishEvent(const nlohmann::json& event, const PropertyBag& properties) {
  transport_->Publish(EventTopic(config_.device_id, properties), event.dump());
  observability_->IncrementPublished();
}

}  // namespace iothub
