/*
 * 설명: 저장소 구현들이 공유하는 목록 정렬 규칙을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/memory_match_store_test.cpp
 */
#include "arbiter/match_store.hpp"

#include <algorithm>

namespace arbiter {

void SortByRecency(std::vector<Match>& matches) {
  std::sort(matches.begin(), matches.end(), [](const Match& lhs, const Match& rhs) {
    if (lhs.UpdatedAt() != rhs.UpdatedAt()) {
      return lhs.UpdatedAt() > rhs.UpdatedAt();
    }
    return lhs.Id() < rhs.Id();
  });
}

}  // namespace arbiter
