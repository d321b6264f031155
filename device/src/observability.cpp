/*
 * 설명: 구조화 로그와 세션 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "iothub/observability.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

namespace iothub {

namespace {
const char* LevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}
}  // namespace

LogLevel ParseLogLevel(const std::string& value) {
  if (value == "debug") {
    return LogLevel::kDebug;
  }
  if (value == "warn") {
    return LogLevel::kWarn;
  }
  if (value == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

Observability::Observability(LogLevel min_level) : Observability(min_level, std::cout) {}

Observability::Observability(LogLevel min_level, std::ostream& out) : min_level_(min_level), out_(out) {}

void Observability::IncrementReceived() { messages_received_.fetch_add(1); }

void Observability::IncrementPublished() { messages_published_.fetch_add(1); }

void Observability::IncrementTimeout() { twin_timeouts_.fetch_add(1); }

void Observability::IncrementStale() { stale_responses_.fetch_add(1); }

void Observability::IncrementReconnect() { reconnects_.fetch_add(1); }

void Observability::IncrementTokenRefresh() { token_refreshes_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.messages_received = messages_received_.load();
  snapshot.messages_published = messages_published_.load();
  snapshot.twin_timeouts = twin_timeouts_.load();
  snapshot.stale_responses = stale_responses_.load();
  snapshot.reconnects = reconnects_.load();
  snapshot.token_refreshes = token_refreshes_.load();
  return snapshot;
}

void Observability::Log(LogLevel level, const LogContext& ctx) const {
  if (level < min_level_) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = LevelName(level);
  log_json["event"] = ctx.name;
  if (ctx.topic) {
    log_json["topic"] = *ctx.topic;
  }
  if (ctx.request_id) {
    log_json["rid"] = *ctx.request_id;
  }
  if (ctx.status) {
    log_json["status"] = *ctx.status;
  }
  if (ctx.detail) {
    log_json["detail"] = *ctx.detail;
  }
  std::lock_guard<std::mutex> lock(out_mutex_);
  out_ << log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

}  // namespace iothub
