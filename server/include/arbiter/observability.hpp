/*
 * 설명: 구조화 로그(레벨 필터 포함)와 요청/오류 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/tool_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace arbiter {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

std::string_view ToString(LogLevel level);
std::optional<LogLevel> ParseLogLevel(std::string_view text);

struct LogContext {
  std::string trace_id;
  std::string name;
  long latency_ms{0};
  LogLevel level{LogLevel::kInfo};
  std::optional<std::string> match_id;
  std::optional<std::string> error_code;
  std::optional<std::string> message;
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t active_matches{0};
  std::uint64_t total_matches{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo) : min_level_(min_level) {}

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  MetricsSnapshot Snapshot(std::uint64_t active_matches, std::uint64_t total_matches) const;
  bool Enabled(LogLevel level) const { return level >= min_level_; }
  void Log(const LogContext& ctx) const;

 private:
  LogLevel min_level_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
  mutable std::mutex out_mutex_;
};

}  // namespace arbiter
