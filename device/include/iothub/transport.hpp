/*
 * 설명: 디바이스 세션이 사용하는 MQTT 발행/구독 연결의 추상 인터페이스를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: device/tests/unit/device_dispatch_test.cpp, device/tests/it/device_session_it_test.cpp
 */
#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace iothub {

struct MqttMessage {
  std::string topic;
  std::string payload;
};

struct ConnectOptions {
  std::string host;
  unsigned short keepalive_seconds{60};
  unsigned short port{8883};
  bool use_tls{true};
};

enum class TransportEvent { kPublish };

using TopicFilter = std::pair<std::string, int>;
using MessageHandler = std::function<void(const MqttMessage&)>;
using MessagePredicate = std::function<bool(const MqttMessage&)>;
using ReconnectHook = std::function<void()>;
using HandlerId = std::uint64_t;

// 구현체는 수신 루프에서 kPublish 이벤트마다 등록된 모든 핸들러 중 predicate가 참인 것을 동기 호출한다.
// on_reconnect는 재연결 핸드셰이크 직전에 호출되며, 그 안에서 SetCredentials를 다시 호출할 수 있어야 한다.
// Off/ClearReconnectHook가 반환된 뒤에는 해당 핸들러나 훅을 새로 호출하지 않는다.
class MqttTransport {
 public:
  virtual ~MqttTransport() = default;

  virtual void SetCredentials(const std::string& username, const std::string& password) = 0;
  virtual void Connect(const ConnectOptions& options, ReconnectHook on_reconnect) = 0;
  virtual void Subscribe(const std::vector<TopicFilter>& filters) = 0;
  virtual void Publish(const std::string& topic, const std::optional<std::string>& payload) = 0;
  virtual HandlerId On(TransportEvent event, MessageHandler handler, MessagePredicate predicate) = 0;
  virtual void Off(HandlerId id) = 0;
  virtual void ClearReconnectHook() = 0;
  virtual void Loop() = 0;
};

}  // namespace iothub
