/*
 * 설명: 매치 생성(동시 진행 상한 적용), 조회, 매치 단위 직렬화된 변경-저장, 가져오기/내보내기를 조율한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_manager_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "arbiter/match.hpp"
#include "arbiter/match_store.hpp"
#include "arbiter/observability.hpp"

namespace arbiter {

inline constexpr std::size_t kDefaultMaxActiveMatches = 5;

struct MoveOutcome {
  Match match;
  std::string san;
};

struct ImportOutcome {
  Match match;
  std::vector<std::string> warnings;
};

class SessionManager {
 public:
  explicit SessionManager(std::shared_ptr<MatchStore> store,
                          std::size_t max_active_matches = kDefaultMaxActiveMatches,
                          std::shared_ptr<Observability> observability = nullptr);

  // 진행 중 매치 수가 상한 이상이면 CapacityExceededError. 카운트와 생성은 하나의 임계 구역에서 수행한다.
  Match Create(const std::string& white_player_id, const std::string& black_player_id,
               std::optional<TimeControl> time_control = std::nullopt);

  std::optional<Match> Get(const std::string& id);
  bool Delete(const std::string& id);
  bool Exists(const std::string& id);
  std::vector<Match> ListAll();
  std::vector<Match> ListByStatus(MatchStatus status);
  std::vector<Match> ListByParticipant(const std::string& participant_id);
  std::size_t CountActive();

  // player_id가 주어지면 잠금 안에서 참가자 여부와 차례를 함께 확인한다.
  MoveOutcome ApplyMove(const std::string& id, const std::string& move_text,
                        const std::optional<std::string>& player_id = std::nullopt);
  Match Resign(const std::string& id, const std::string& participant_id);
  Match OfferDraw(const std::string& id, const std::string& participant_id);
  Match AcceptDraw(const std::string& id, const std::string& participant_id);
  Match DeclineDraw(const std::string& id, const std::string& participant_id);
  Match Pause(const std::string& id, const std::string& participant_id);
  Match Resume(const std::string& id);
  Match Complete(const std::string& id, const std::string& result);

  MoveValidation ValidateMove(const std::string& id, const std::string& move_text);
  std::optional<DrawStatus> GetDrawStatus(const std::string& id);
  std::vector<std::string> LegalMoves(const std::string& id, const std::optional<std::string>& square);
  MoveHistory GetMoveHistory(const std::string& id, HistoryFormat format);
  GameExport Export(const std::string& id, ExportFormat format);
  ImportOutcome Import(const std::string& pgn, const ImportOverrides& overrides);

  bool HealthCheck();
  void Close();

  std::size_t MaxActiveMatches() const { return max_active_matches_; }
  // 현재 잡혀 있거나 대기 중인 매치 잠금 수. 진단과 테스트용.
  std::size_t LockRegistrySize();

 private:
  // 매치 잠금을 쥐고, 해제할 때 다른 보유자가 없으면 레지스트리 항목도 지운다.
  class MatchLockLease {
   public:
    MatchLockLease(SessionManager& owner, const std::string& id);
    ~MatchLockLease();
    MatchLockLease(const MatchLockLease&) = delete;
    MatchLockLease& operator=(const MatchLockLease&) = delete;

   private:
    SessionManager& owner_;
    std::string id_;
    std::shared_ptr<std::mutex> mutex_;
    std::unique_lock<std::mutex> lock_;
  };

  template <typename Fn>
  Match Mutate(const std::string& id, const char* event_name, Fn&& fn);
  Match LoadOrThrow(const std::string& id);
  std::shared_ptr<std::mutex> LockFor(const std::string& id);
  void ReleaseLock(const std::string& id, const std::shared_ptr<std::mutex>& mutex);
  void AdmitAndSave(const Match& match);
  void LogEvent(const char* name, const std::string& match_id) const;

  std::shared_ptr<MatchStore> store_;
  std::size_t max_active_matches_;
  std::shared_ptr<Observability> observability_;
  std::mutex admission_mutex_;
  std::mutex locks_mutex_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> match_locks_;
};

}  // namespace arbiter
