/*
 * 설명: 구조화 로그(JSON 라인)와 인증/채널 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp, server/tests/e2e/auth_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace teamlink {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

std::optional<LogLevel> ParseLogLevel(std::string_view value);
std::string_view ToString(LogLevel level);

struct LogContext {
  std::string trace_id;
  std::string name;
  LogLevel level{LogLevel::kInfo};
  std::optional<std::string> user_id;
  std::optional<std::string> organization_id;
  std::optional<std::string> detail;
  long latency_ms{0};
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t websocket_active{0};
  std::uint64_t connections_accepted{0};
  std::uint64_t connections_rejected{0};
  std::uint64_t subscriptions_active{0};
  std::uint64_t messages_delivered{0};
  std::uint64_t messages_rejected{0};
  std::uint64_t revocation_records{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo, std::ostream* out = nullptr);

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void WebsocketOpened();
  void WebsocketClosed();
  void IncrementConnectionAccepted();
  void IncrementConnectionRejected();
  void SetSubscriptionsActive(std::uint64_t count);
  void IncrementMessageDelivered();
  void IncrementMessageRejected();
  MetricsSnapshot Snapshot(std::uint64_t revocation_records) const;

  bool Enabled(LogLevel level) const { return level >= min_level_; }
  void Log(const LogContext& ctx) const;
  void Event(LogLevel level, std::string name, std::optional<std::string> user_id = std::nullopt,
             std::optional<std::string> organization_id = std::nullopt,
             std::optional<std::string> detail = std::nullopt) const;

 private:
  LogLevel min_level_;
  std::ostream* out_;
  mutable std::mutex out_mutex_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> websocket_active_{0};
  std::atomic<std::uint64_t> connections_accepted_{0};
  std::atomic<std::uint64_t> connections_rejected_{0};
  std::atomic<std::uint64_t> subscriptions_active_{0};
  std::atomic<std::uint64_t> messages_delivered_{0};
  std::atomic<std::uint64_t> messages_rejected_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace teamlink
