/*
 * 설명: 매치 상태, 시간 제어, 무승부 정보, 수 기록 형식 등 매치 값 타입을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/match_serialization_test.cpp, server/tests/unit/draw_detection_test.cpp
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace arbiter {

enum class MatchStatus { kActive, kPaused, kCompleted };

std::string_view ToString(MatchStatus status);
std::optional<MatchStatus> ParseMatchStatus(std::string_view text);

inline constexpr const char* kWhiteWins = "1-0";
inline constexpr const char* kBlackWins = "0-1";
inline constexpr const char* kDrawResult = "1/2-1/2";

bool IsFinalResult(std::string_view result);

// 직렬화 왕복이 손실 없도록 밀리초 단위로 보관한다.
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

Timestamp NowMillis();
std::string FormatTimestamp(Timestamp ts);
std::optional<Timestamp> ParseTimestamp(const std::string& text);

enum class TimeControlType { kUnlimited, kFixed, kFischer };

std::string_view ToString(TimeControlType type);
std::optional<TimeControlType> ParseTimeControlType(std::string_view text);

// 시간 단위는 초.
struct TimeControl {
  TimeControlType type{TimeControlType::kUnlimited};
  std::optional<long> initial_time;
  std::optional<long> increment;
};

enum class DrawType { kStalemate, kInsufficientMaterial, kFiftyMove, kThreefoldRepetition, kAgreement };

std::string_view ToString(DrawType type);
std::optional<DrawType> ParseDrawType(std::string_view text);

struct DrawDetails {
  DrawType type{DrawType::kAgreement};
  std::string description;
  std::optional<int> halfmove_clock;
  std::optional<int> repetition_count;
};

struct DrawStatus {
  int halfmove_clock{0};
  int moves_until_fifty_move{50};
  int repetition_count{1};
  bool is_approaching_fifty_move{false};
  bool is_approaching_repetition{false};
};

struct MoveValidation {
  bool valid{false};
  std::optional<std::string> reason;
  std::optional<std::string> suggestion;
};

enum class HistoryFormat { kAlgebraic, kUci, kVerbose, kWithFen, kDetailed };

std::string_view ToString(HistoryFormat format);
std::optional<HistoryFormat> ParseHistoryFormat(std::string_view text);

struct AlgebraicHistory {
  std::vector<std::string> moves;
};

struct UciHistory {
  std::vector<std::string> moves;
};

struct VerboseEntry {
  int move_number{1};
  std::string player;  // white | black
  std::string move;
  std::optional<Timestamp> timestamp;
};

struct VerboseHistory {
  std::vector<VerboseEntry> entries;
};

struct FenEntry {
  int move_number{1};  // ply 번호
  std::string move;
  std::string fen;
};

struct WithFenHistory {
  std::vector<FenEntry> entries;
};

struct DetailedEntry {
  int move_number{1};
  std::string move;
  std::string fen;
  bool check{false};
  bool capture{false};
  bool castling{false};
};

struct DetailedHistory {
  std::vector<DetailedEntry> entries;
};

using MoveHistory = std::variant<AlgebraicHistory, UciHistory, VerboseHistory, WithFenHistory, DetailedHistory>;

enum class ExportFormat { kPgn, kFen };

std::string_view ToString(ExportFormat format);
std::optional<ExportFormat> ParseExportFormat(std::string_view text);

struct GameExport {
  std::string match_id;
  ExportFormat format{ExportFormat::kPgn};
  std::string content;
  std::string white_player;
  std::string black_player;
  std::string result;  // 미종료면 "*"
  MatchStatus status{MatchStatus::kActive};
  std::string date;  // YYYY-MM-DD
};

struct ImportOverrides {
  std::optional<std::string> white_player_id;
  std::optional<std::string> black_player_id;
};

}  // namespace arbiter
