/*
 * 설명: SAS 토큰 만료 계산에 쓰는 외부 시각 공급원과 단조 시계를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: device/tests/it/http_time_source_it_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace iothub {

using TimestampFn = std::function<std::int64_t()>;
using MonotonicClock = std::function<std::chrono::milliseconds()>;

std::int64_t SystemClockTimestamp();
std::chrono::milliseconds SteadyClockNow();

struct HttpEndpoint {
  std::string host;
  std::string port{"80"};
  std::string target{"/"};
};

constexpr std::chrono::milliseconds kDefaultTimeSourceTimeout{5000};

// RFC 6901 형식이 아니면 ConfigError를 던진다.
void ValidateJsonPointer(const std::string& json_pointer);

// http://host[:port]/target 형식만 지원한다. TLS 시각 서버는 지원하지 않는다.
HttpEndpoint ParseHttpUrl(const std::string& url);

class HttpTimeSource {
 public:
  // 이름 해석, 연결, 요청 전송, 응답 수신에 각각 timeout 기한이 걸린다.
  HttpTimeSource(HttpEndpoint endpoint, std::string json_pointer,
                 std::chrono::milliseconds timeout = kDefaultTimeSourceTimeout);

  std::int64_t operator()() const;

 private:
  HttpEndpoint endpoint_;
  std::string json_pointer_;
  std::chrono::milliseconds timeout_;
};

TimestampFn MakeTimestampFn(const std::string& time_url, const std::string& json_pointer);

}  // namespace iothub
