/*
 * 설명: 구조화 로그 출력과 메트릭 카운터를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp
 */
#include "teamlink/observability.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace teamlink {

std::optional<LogLevel> ParseLogLevel(std::string_view value) {
  if (value == "debug") {
    return LogLevel::kDebug;
  }
  if (value == "info") {
    return LogLevel::kInfo;
  }
  if (value == "warn" || value == "warning") {
    return LogLevel::kWarn;
  }
  if (value == "error") {
    return LogLevel::kError;
  }
  return std::nullopt;
}

std::string_view ToString(LogLevel level) {
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

Observability::Observability(LogLevel min_level, std::ostream* out)
    : min_level_(min_level), out_(out ? out : &std::cout) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::WebsocketOpened() { websocket_active_.fetch_add(1); }

void Observability::WebsocketClosed() {
  auto current = websocket_active_.load();
  while (current > 0 && !websocket_active_.compare_exchange_weak(current, current - 1)) {
  }
}

void Observability::IncrementConnectionAccepted() { connections_accepted_.fetch_add(1); }

void Observability::IncrementConnectionRejected() { connections_rejected_.fetch_add(1); }

void Observability::SetSubscriptionsActive(std::uint64_t count) { subscriptions_active_.store(count); }

void Observability::IncrementMessageDelivered() { messages_delivered_.fetch_add(1); }

void Observability::IncrementMessageRejected() { messages_rejected_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot(std::uint64_t revocation_records) const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.websocket_active = websocket_active_.load();
  snapshot.connections_accepted = connections_accepted_.load();
  snapshot.connections_rejected = connections_rejected_.load();
  snapshot.subscriptions_active = subscriptions_active_.load();
  snapshot.messages_delivered = messages_delivered_.load();
  snapshot.messages_rejected = messages_rejected_.load();
  snapshot.revocation_records = revocation_records;
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(ctx.level)) {
    return;
  }
  nlohmann::json log_json;
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["level"] = ToString(ctx.level);
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.user_id) {
    log_json["userId"] = *ctx.user_id;
  }
  if (ctx.organization_id) {
    log_json["organizationId"] = *ctx.organization_id;
  }
  if (ctx.detail) {
    log_json["detail"] = *ctx.detail;
  }
  std::lock_guard<std::mutex> lock(out_mutex_);
  *out_ << log_json.dump() << std::endl;
}

void Observability::Event(LogLevel level, std::string name, std::optional<std::string> user_id,
                          std::optional<std::string> organization_id, std::optional<std::string> detail) const {
  if (!Enabled(level)) {
    return;
  }
  LogContext ctx;
  ctx.name = std::move(name);
  ctx.level = level;
  ctx.user_id = std::move(user_id);
  ctx.organization_id = std::move(organization_id);
  ctx.detail = std::move(detail);
  Log(ctx);
}

}  // namespace teamlink
