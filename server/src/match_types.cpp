/*
 * 설명: 매치 값 타입의 문자열 변환과 밀리초 단위 ISO-8601 시각 변환을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/match_serialization_test.cpp
 */
#include "arbiter/match_types.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace arbiter {

std::string_view ToString(MatchStatus status) {
  switch (status) {
    case MatchStatus::kActive:
      return "active";
    case MatchStatus::kPaused:
      return "paused";
    case MatchStatus::kCompleted:
      return "completed";
  }
  return "active";
}

std::optional<MatchStatus> ParseMatchStatus(std::string_view text) {
  if (text == "active") return MatchStatus::kActive;
  if (text == "paused") return MatchStatus::kPaused;
  if (text == "completed") return MatchStatus::kCompleted;
  return std::nullopt;
}

bool IsFinalResult(std::string_view result) {
  return result == kWhiteWins || result == kBlackWins || result == kDrawResult;
}

Timestamp NowMillis() {
  return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

std::string FormatTimestamp(Timestamp ts) {
  auto secs = std::chrono::floor<std::chrono::seconds>(ts);
  auto millis = (ts - secs).count();
  std::time_t tt = std::chrono::system_clock::to_time_t(secs);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%FT%T") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
  return oss.str();
}

std::optional<Timestamp> ParseTimestamp(const std::string& text) {
  std::tm tm{};
  std::istringstream iss(text);
  iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (iss.fail()) {
    return std::nullopt;
  }
  long long millis = 0;
  if (iss.peek() == '.') {
    iss.get();
    int digits = 0;
    while (std::isdigit(iss.peek())) {
      int d = iss.get() - '0';
      if (digits < 3) {
        millis = millis * 10 + d;
      }
      ++digits;
    }
    if (digits == 0) {
      return std::nullopt;
    }
    for (; digits < 3; ++digits) {
      millis *= 10;
    }
  }
  if (iss.peek() == 'Z') {
    iss.get();
  }
  if (iss.peek() != std::char_traits<char>::eof()) {
    return std::nullopt;
  }
  std::time_t seconds = timegm(&tm);
  return Timestamp{std::chrono::milliseconds(static_cast<long long>(seconds) * 1000 + millis)};
}

std::string_view ToString(TimeControlType type) {
  switch (type) {
    case TimeControlType::kUnlimited:
      return "unlimited";
    case TimeControlType::kFixed:
      return "fixed";
    case TimeControlType::kFischer:
      return "fischer";
  }
  return "unlimited";
}

std::optional<TimeControlType> ParseTimeControlType(std::string_view text) {
  if (text == "unlimited") return TimeControlType::kUnlimited;
  if (text == "fixed") return TimeControlType::kFixed;
  if (text == "fischer") return TimeControlType::kFischer;
  return std::nullopt;
}

std::string_view ToString(DrawType type) {
  switch (type) {
    case DrawType::kStalemate:
      return "stalemate";
    case DrawType::kInsufficientMaterial:
      return "insufficient_material";
    case DrawType::kFiftyMove:
      return "fifty_move";
    case DrawType::kThreefoldRepetition:
      return "threefold_repetition";
    case DrawType::kAgreement:
      return "agreement";
  }
  return "agreement";
}

std::optional<DrawType> ParseDrawType(std::string_view text) {
  if (text == "stalemate") return DrawType::kStalemate;
  if (text == "insufficient_material") return DrawType::kInsufficientMaterial;
  if (text == "fifty_move") return DrawType::kFiftyMove;
  if (text == "threefold_repetition") return DrawType::kThreefoldRepetition;
  if (text == "agreement") return DrawType::kAgreement;
  return std::nullopt;
}

std::string_view ToString(HistoryFormat format) {
  switch (format) {
    case HistoryFormat::kAlgebraic:
      return "algebraic";
    case HistoryFormat::kUci:
      return "uci";
    case HistoryFormat::kVerbose:
      return "verbose";
    case HistoryFormat::kWithFen:
      return "with_fen";
    case HistoryFormat::kDetailed:
      return "detailed";
  }
  return "algebraic";
}

std::optional<HistoryFormat> ParseHistoryFormat(std::string_view text) {
  if (text == "algebraic") return HistoryFormat::kAlgebraic;
  if (text == "uci" || text == "UCI") return HistoryFormat::kUci;
  if (text == "verbose") return HistoryFormat::kVerbose;
  if (text == "with_fen") return HistoryFormat::kWithFen;
  if (text == "detailed") return HistoryFormat::kDetailed;
  return std::nullopt;
}

std::string_view ToString(ExportFormat format) { return format == ExportFormat::kPgn ? "PGN" : "FEN"; }

std::optional<ExportFormat> ParseExportFormat(std::string_view text) {
  if (text == "PGN" || text == "pgn") return ExportFormat::kPgn;
  if (text == "FEN" || text == "fen") return ExportFormat::kFen;
  return std::nullopt;
}

}  // namespace arbiter
