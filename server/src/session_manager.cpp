/*
 * 설명: 동시 진행 상한, 매치 단위 잠금, 로드-변경-저장 흐름을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_manager_test.cpp
 */
#include "arbiter/session_manager.hpp"

#include <stdexcept>

namespace arbiter {

SessionManager::SessionManager(std::shared_ptr<MatchStore> store, std::size_t max_active_matches,
                               std::shared_ptr<Observability> observability)
    : store_(std::move(store)),
      max_active_matches_(max_active_matches),
      observability_(std::move(observability)) {
  if (!store_) {
    throw std::invalid_argument("매치 저장소가 필요합니다");
  }
}

void SessionManager::LogEvent(const char* name, const std::string& match_id) const {
  if (!observability_ || !observability_->Enabled(LogLevel::kDebug)) {
    return;
  }
  LogContext ctx;
  ctx.trace_id = observability_->NextTraceId();
  ctx.name = name;
  ctx.level = LogLevel::kDebug;
  ctx.match_id = match_id;
  observability_->Log(ctx);
}

std::shared_ptr<std::mutex> SessionManager::LockFor(const std::string& id) {
  std::lock_guard<std::mutex> lock(locks_mutex_);
  auto& entry = match_locks_[id];
  if (!entry) {
    entry = std::make_shared<std::mutex>();
  }
  return entry;
}

void SessionManager::ReleaseLock(const std::string& id, const std::shared_ptr<std::mutex>& mutex) {
  std::lock_guard<std::mutex> lock(locks_mutex_);
  auto it = match_locks_.find(id);
  // 레지스트리와 호출자 외에 참조가 없으면 기다리는 요청도 없다.
  if (it != match_locks_.end() && it->second == mutex && mutex.use_count() == 2) {
    match_locks_.erase(it);
  }
}

std::size_t SessionManager::LockRegistrySize() {
  std::lock_guard<std::mutex> lock(locks_mutex_);
  return match_locks_.size();
}

SessionManager::MatchLockLease::MatchLockLease(SessionManager& owner, const std::string& id)
    : owner_(owner), id_(id), mutex_(owner.LockFor(id)), lock_(*mutex_) {}

SessionManager::MatchLockLease::~MatchLockLease() {
  lock_.unlock();
  owner_.ReleaseLock(id_, mutex_);
}

void SessionManager::AdmitAndSave(const Match& match) {
  std::lock_guard<std::mutex> admission(admission_mutex_);
  if (match.Status() == MatchStatus::kActive && store_->CountActive() >= max_active_matches_) {
    throw CapacityExceededError(max_active_matches_);
  }
  store_->Save(match);
}

Match SessionManager::Create(const std::string& white_player_id, const std::string& black_player_id,
                             std::optional<TimeControl> time_control) {
  Match match(white_player_id, black_player_id, std::move(time_control));
  AdmitAndSave(match);
  LogEvent("match.created", match.Id());
  return match;
}

std::optional<Match> SessionManager::Get(const std::string& id) { return store_->Load(id); }

bool SessionManager::Delete(const std::string& id) {
  bool deleted = false;
  {
    MatchLockLease lease(*this, id);
    deleted = store_->Delete(id);
  }
  if (deleted) {
    LogEvent("match.deleted", id);
  }
  return deleted;
}

bool SessionManager::Exists(const std::string& id) { return store_->Exists(id); }

std::vector<Match> SessionManager::ListAll() { return store_->LoadAll(); }

std::vector<Match> SessionManager::ListByStatus(MatchStatus status) { return store_->LoadByStatus(status); }

std::vector<Match> SessionManager::ListByParticipant(const std::string& participant_id) {
  return store_->LoadByParticipant(participant_id);
}

std::size_t SessionManager::CountActive() { return store_->CountActive(); }

Match SessionManager::LoadOrThrow(const std::string& id) {
  auto match = store_->Load(id);
  if (!match) {
    throw NotFoundError(id);
  }
  return std::move(*match);
}

template <typename Fn>
Match SessionManager::Mutate(const std::string& id, const char* event_name, Fn&& fn) {
  MatchLockLease lease(*this, id);
  Match match = LoadOrThrow(id);
  fn(match);
  store_->Save(match);
  LogEvent(event_name, id);
  return match;
}

MoveOutcome SessionManager::ApplyMove(const std::string& id, const std::string& move_text,
                                      const std::optional<std::string>& player_id) {
  std::string san;
  Match match = Mutate(id, "match.move", [&](Match& m) {
    if (player_id) {
      if (!m.IsParticipant(*player_id)) {
        throw InvalidArgumentError("not_participant", "매치 참가자가 아닙니다: " + *player_id);
      }
      if (m.Status() == MatchStatus::kActive && m.TurnPlayerId() != *player_id) {
        throw IllegalStateError("not_your_turn", "상대의 차례입니다: " + *player_id);
      }
    }
    san = m.ApplyMove(move_text);
  });
  return MoveOutcome{std::move(match), std::move(san)};
}

Match SessionManager::Resign(const std::string& id, const std::string& participant_id) {
  return Mutate(id, "match.resign", [&](Match& m) { m.Resign(participant_id); });
}

Match SessionManager::OfferDraw(const std::string& id, const std::string& participant_id) {
  return Mutate(id, "match.offer_draw", [&](Match& m) { m.OfferDraw(participant_id); });
}

Match SessionManager::AcceptDraw(const std::string& id, const std::string& participant_id) {
  return Mutate(id, "match.accept_draw", [&](Match& m) { m.AcceptDraw(participant_id); });
}

Match SessionManager::DeclineDraw(const std::string& id, const std::string& participant_id) {
  return Mutate(id, "match.decline_draw", [&](Match& m) {
    if (!m.IsParticipant(participant_id)) {
      throw InvalidArgumentError("not_participant", "매치 참가자가 아닙니다: " + participant_id);
    }
    m.DeclineDraw();
  });
}

Match SessionManager::Pause(const std::string& id, const std::string& participant_id) {
  return Mutate(id, "match.pause", [&](Match& m) { m.Pause(participant_id); });
}

Match SessionManager::Resume(const std::string& id) {
  return Mutate(id, "match.resume", [](Match& m) { m.Resume(); });
}

Match SessionManager::Complete(const std::string& id, const std::string& result) {
  return Mutate(id, "match.complete", [&](Match& m) { m.CompleteGame(result); });
}

MoveValidation SessionManager::ValidateMove(const std::string& id, const std::string& move_text) {
  return LoadOrThrow(id).ValidateMove(move_text);
}

std::optional<DrawStatus> SessionManager::GetDrawStatus(const std::string& id) {
  return LoadOrThrow(id).GetDrawStatus();
}

std::vector<std::string> SessionManager::LegalMoves(const std::string& id, const std::optional<std::string>& square) {
  Match match = LoadOrThrow(id);
  return square ? match.LegalMovesFrom(*square) : match.LegalMoves();
}

MoveHistory SessionManager::GetMoveHistory(const std::string& id, HistoryFormat format) {
  return LoadOrThrow(id).GetMoveHistory(format);
}

GameExport SessionManager::Export(const std::string& id, ExportFormat format) {
  return LoadOrThrow(id).Export(format);
}

ImportOutcome SessionManager::Import(const std::string& pgn, const ImportOverrides& overrides) {
  std::vector<std::string> warnings;
  Match match = Match::FromPgn(pgn, overrides, &warnings);
  AdmitAndSave(match);
  LogEvent("match.imported", match.Id());
  return ImportOutcome{std::move(match), std::move(warnings)};
}

bool SessionManager::HealthCheck() { return store_->HealthCheck(); }

void SessionManager::Close() {
  store_->Close();
  std::lock_guard<std::mutex> lock(locks_mutex_);
  match_locks_.clear();
}

}  // namespace arbiter
