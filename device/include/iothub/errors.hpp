/*
 * 설명: 디바이스 세션에서 발생하는 설정/타임아웃/프로토콜 예외 타입을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: device/tests/unit/config_test.cpp, device/tests/unit/twin_correlator_test.cpp,
 *         device/tests/unit/device_dispatch_test.cpp
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace iothub {

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

class TimeoutError : public std::runtime_error {
 public:
  TimeoutError(const std::string& message, std::int64_t request_id)
      : std::runtime_error(message), request_id(request_id) {}
  std::int64_t request_id;
};

class ProtocolError : public std::runtime_error {
 public:
  ProtocolError(const std::string& message, std::string topic)
      : std::runtime_error(message), topic(std::move(topic)) {}
  std::string topic;
};

class UnknownMethodError : public ProtocolError {
 public:
  UnknownMethodError(const std::string& method_name, const std::string& request_id, const std::string& topic)
      : ProtocolError("등록되지 않은 다이렉트 메서드 호출: " + method_name, topic),
        method_name(method_name),
        request_id(request_id) {}
  std::string method_name;
  std::string request_id;
};

class TimeSourceError : public std::runtime_error {
 public:
  explicit TimeSourceError(const std::string& message) : std::runtime_error(message) {}
};

}  // namespace iothub
