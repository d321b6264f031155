/*
 * 설명: 구조화 로그와 세션 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: device/tests/unit/observability_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

namespace iothub {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(const std::string& value);

struct LogContext {
  std::string name;
  std::optional<std::string> topic;
  std::optional<std::int64_t> request_id;
  std::optional<int> status;
  std::optional<std::string> detail;
};

struct MetricsSnapshot {
  std::uint64_t messages_received{0};
  std::uint64_t messages_published{0};
  std::uint64_t twin_timeouts{0};
  std::uint64_t stale_responses{0};
  std::uint64_t reconnects{0};
  std::uint64_t token_refreshes{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo);
  Observability(LogLevel min_level, std::ostream& out);

  void IncrementReceived();
  void IncrementPublished();
  void IncrementTimeout();
  void IncrementStale();
  void IncrementReconnect();
  void IncrementTokenRefresh();
  MetricsSnapshot Snapshot() const;

  void Log(LogLevel level, const LogContext& ctx) const;

 private:
  LogLevel min_level_;
  std::ostream& out_;
  mutable std::mutex out_mutex_;
  std::atomic<std::uint64_t> messages_received_{0};
  std::atomic<std::uint64_t> messages_published_{0};
  std::atomic<std::uint64_t> twin_timeouts_{0};
  std::atomic<std::uint64_t> stale_responses_{0};
  std::atomic<std::uint64_t> reconnects_{0};
  std::atomic<std::uint64_t> token_refreshes_{0};
};

}  // namespace iothub
