/*
 * 설명: 매치 저장소 계약. 세션 관리자는 구현 기술과 무관하게 이 인터페이스에만 의존한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/memory_match_store_test.cpp, server/tests/it/mariadb_match_store_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "arbiter/match.hpp"

namespace arbiter {

// 모든 조회는 저장소 내부 상태와 독립된 복사본을 돌려준다.
// 목록은 updatedAt 내림차순, 같으면 id 오름차순이다.
class MatchStore {
 public:
  virtual ~MatchStore() = default;

  virtual void Save(const Match& match) = 0;
  // 복원에 실패한 레코드는 CorruptStateError.
  virtual std::optional<Match> Load(const std::string& id) = 0;
  virtual bool Delete(const std::string& id) = 0;
  virtual bool Exists(const std::string& id) = 0;
  // 복원에 실패한 레코드는 경고 로그를 남기고 건너뛴다.
  virtual std::vector<Match> LoadAll() = 0;
  virtual std::vector<Match> LoadByStatus(MatchStatus status) = 0;
  virtual std::vector<Match> LoadByParticipant(const std::string& participant_id) = 0;
  virtual std::size_t CountActive() = 0;
  virtual bool HealthCheck() = 0;
  virtual void Close() = 0;
};

void SortByRecency(std::vector<Match>& matches);

}  // namespace arbiter
