/*
 * 설명: 매치 도메인 예외 분류(NotFound, IllegalState, InvalidMove, CapacityExceeded, CorruptState,
 *       InvalidArgument)를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/match_state_test.cpp, server/tests/unit/tool_service_test.cpp
 */
#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace arbiter {

enum class ErrorKind { kNotFound, kIllegalState, kInvalidMove, kCapacityExceeded, kCorruptState, kInvalidArgument };

inline std::string_view ErrorKindCode(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNotFound:
      return "not_found";
    case ErrorKind::kIllegalState:
      return "illegal_state";
    case ErrorKind::kInvalidMove:
      return "invalid_move";
    case ErrorKind::kCapacityExceeded:
      return "capacity_exceeded";
    case ErrorKind::kCorruptState:
      return "corrupt_state";
    case ErrorKind::kInvalidArgument:
      return "invalid_argument";
  }
  return "unknown";
}

// code는 분류 안에서의 구체 사유(paused, inactive 등)를 담는다.
class MatchError : public std::runtime_error {
 public:
  MatchError(ErrorKind kind, std::string code, const std::string& message)
      : std::runtime_error(message), kind(kind), code(std::move(code)) {}
  ErrorKind kind;
  std::string code;
};

class NotFoundError : public MatchError {
 public:
  explicit NotFoundError(const std::string& match_id)
      : MatchError(ErrorKind::kNotFound, "match_not_found", "매치를 찾을 수 없습니다: " + match_id) {}
};

class IllegalStateError : public MatchError {
 public:
  IllegalStateError(std::string code, const std::string& message)
      : MatchError(ErrorKind::kIllegalState, std::move(code), message) {}
};

class InvalidMoveError : public MatchError {
 public:
  InvalidMoveError(const std::string& message, std::optional<std::string> suggestion)
      : MatchError(ErrorKind::kInvalidMove, "illegal_move", message), suggestion(std::move(suggestion)) {}
  std::optional<std::string> suggestion;
};

class CapacityExceededError : public MatchError {
 public:
  explicit CapacityExceededError(std::size_t limit)
      : MatchError(ErrorKind::kCapacityExceeded, "max_active_matches",
                   "동시 진행 가능한 매치 수(" + std::to_string(limit) + ")를 초과했습니다"),
        limit(limit) {}
  std::size_t limit;
};

class CorruptStateError : public MatchError {
 public:
  CorruptStateError(std::string code, const std::string& message)
      : MatchError(ErrorKind::kCorruptState, std::move(code), message) {}
};

class InvalidArgumentError : public MatchError {
 public:
  InvalidArgumentError(std::string code, const std::string& message)
      : MatchError(ErrorKind::kInvalidArgument, std::move(code), message) {}
};

}  // namespace arbiter
