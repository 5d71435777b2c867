/*
 * 설명: 프로세스 메모리에만 매치를 보관하는 휘발성 저장소.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/memory_match_store_test.cpp
 */
#pragma once

#include <mutex>
#include <unordered_map>

#include "arbiter/match_store.hpp"

namespace arbiter {

class MemoryMatchStore : public MatchStore {
 public:
  void Save(const Match& match) override;
  std::optional<Match> Load(const std::string& id) override;
  bool Delete(const std::string& id) override;
  bool Exists(const std::string& id) override;
  std::vector<Match> LoadAll() override;
  std::vector<Match> LoadByStatus(MatchStatus status) override;
  std::vector<Match> LoadByParticipant(const std::string& participant_id) override;
  std::size_t CountActive() override;
  bool HealthCheck() override;
  void Close() override;

 private:
  template <typename Pred>
  std::vector<Match> Collect(Pred&& pred);

  std::mutex mutex_;
  std::unordered_map<std::string, Match> matches_;
  bool closed_{false};
};

}  // namespace arbiter
