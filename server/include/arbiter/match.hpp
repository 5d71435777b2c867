/*
 * 설명: 매치 엔티티(상태 머신, 반복/50수 집계, 수 기록, 내보내기, PGN 가져오기, JSON 덤프/복원)를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/match_state_test.cpp, server/tests/unit/draw_detection_test.cpp,
 *         server/tests/unit/match_serialization_test.cpp
 */
#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "arbiter/chess/board.hpp"
#include "arbiter/match_error.hpp"
#include "arbiter/match_types.hpp"

namespace arbiter {

// 매치 한 판의 전체 상태. 값 타입이므로 복사본은 서로 독립적이다.
class Match {
 public:
  Match(std::string white_player_id, std::string black_player_id,
        std::optional<TimeControl> time_control = std::nullopt);

  // 무브텍스트를 새 매치에 재생한다. 잘못된 PGN/수는 InvalidArgumentError.
  static Match FromPgn(const std::string& pgn, const ImportOverrides& overrides,
                       std::vector<std::string>* warnings = nullptr);
  // 저장된 수를 시작 국면부터 재생해 복원한다. 불일치는 CorruptStateError.
  static Match FromJson(const nlohmann::json& json);
  nlohmann::json ToJson() const;

  // 이동 횟수를 제외한 FEN 앞 네 필드.
  static std::string Fingerprint(const std::string& fen);

  const std::string& Id() const { return id_; }
  const std::string& WhitePlayerId() const { return white_player_id_; }
  const std::string& BlackPlayerId() const { return black_player_id_; }
  MatchStatus Status() const { return status_; }
  const std::string& Fen() const { return fen_; }
  const std::vector<std::string>& MoveLog() const { return move_log_; }
  std::string NotationLog() const;
  chess::Color Turn() const { return board_.SideToMove(); }
  const std::string& TurnPlayerId() const;
  const std::optional<std::string>& Result() const { return result_; }
  const std::optional<DrawDetails>& Draw() const { return draw_details_; }
  const std::map<std::string, int>& PositionHistory() const { return position_history_; }
  const std::optional<std::string>& DrawOfferFrom() const { return draw_offer_from_; }
  const std::optional<std::string>& PauseRequestedBy() const { return pause_requested_by_; }
  Timestamp CreatedAt() const { return created_at_; }
  Timestamp UpdatedAt() const { return updated_at_; }
  const std::optional<Timestamp>& LastMoveAt() const { return last_move_at_; }
  const std::optional<TimeControl>& GetTimeControl() const { return time_control_; }
  const std::optional<long>& WhiteTimeRemaining() const { return white_time_remaining_; }
  const std::optional<long>& BlackTimeRemaining() const { return black_time_remaining_; }

  bool IsParticipant(const std::string& participant_id) const;
  int RepetitionCount() const;

  std::string ApplyMove(const std::string& move_text);
  MoveValidation ValidateMove(const std::string& move_text) const;
  std::optional<DrawStatus> GetDrawStatus() const;

  void CompleteGame(const std::string& result, std::optional<DrawDetails> details = std::nullopt);
  void Resign(const std::string& participant_id);
  void OfferDraw(const std::string& participant_id);
  void AcceptDraw(const std::string& participant_id);
  void DeclineDraw();
  void Pause(const std::string& participant_id);
  void Resume();

  std::vector<std::string> LegalMoves() const;
  std::vector<std::string> LegalMovesFrom(const std::string& square) const;
  std::string AsciiBoard() const { return board_.Ascii(); }
  bool InCheck() const { return board_.InCheck(); }

  MoveHistory GetMoveHistory(HistoryFormat format) const;
  GameExport Export(ExportFormat format) const;

 private:
  Match() = default;

  void RequireParticipant(const std::string& participant_id) const;
  void RequireActive(const char* action) const;
  void CompleteIfGameOver();
  std::string Suggestion() const;

  std::string id_;
  std::string white_player_id_;
  std::string black_player_id_;
  MatchStatus status_{MatchStatus::kActive};
  chess::Board board_;
  std::string fen_;
  std::vector<std::string> move_log_;
  std::optional<std::string> result_;
  std::optional<DrawDetails> draw_details_;
  std::map<std::string, int> position_history_;
  std::optional<std::string> draw_offer_from_;
  std::optional<std::string> pause_requested_by_;
  Timestamp created_at_{};
  Timestamp updated_at_{};
  std::optional<Timestamp> last_move_at_;
  std::optional<TimeControl> time_control_;
  std::optional<long> white_time_remaining_;
  std::optional<long> black_time_remaining_;
};

std::string GenerateMatchId();

}  // namespace arbiter
