/*
 * 설명: 뮤텍스로 보호되는 맵 기반 휘발성 매치 저장소를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/memory_match_store_test.cpp
 */
#include "arbiter/memory_match_store.hpp"

#include <stdexcept>

namespace arbiter {

void MemoryMatchStore::Save(const Match& match) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    throw std::runtime_error("닫힌 저장소에는 저장할 수 없습니다");
  }
  matches_.insert_or_assign(match.Id(), match);
}

std::optional<Match> MemoryMatchStore::Load(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = matches_.find(id);
  if (it == matches_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool MemoryMatchStore::Delete(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return matches_.erase(id) > 0;
}

bool MemoryMatchStore::Exists(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return matches_.count(id) > 0;
}

template <typename Pred>
std::vector<Match> MemoryMatchStore::Collect(Pred&& pred) {
  std::vector<Match> out;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, match] : matches_) {
      if (pred(match)) {
        out.push_back(match);
      }
    }
  }
  SortByRecency(out);
  return out;
}

std::vector<Match> MemoryMatchStore::LoadAll() {
  return Collect([](const Match&) { return true; });
}

std::vector<Match> MemoryMatchStore::LoadByStatus(MatchStatus status) {
  return Collect([status](const Match& match) { return match.Status() == status; });
}

std::vector<Match> MemoryMatchStore::LoadByParticipant(const std::string& participant_id) {
  return Collect([&participant_id](const Match& match) { return match.IsParticipant(participant_id); });
}

std::size_t MemoryMatchStore::CountActive() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t count = 0;
  for (const auto& [id, match] : matches_) {
    if (match.Status() == MatchStatus::kActive) {
      ++count;
    }
  }
  return count;
}

bool MemoryMatchStore::HealthCheck() {
  std::lock_guard<std::mutex> lock(mutex_);
  return !closed_;
}

void MemoryMatchStore::Close() {
  std::lock_guard<std::mutex> lock(mutex_);
  matches_.clear();
  closed_ = true;
}

}  // namespace arbiter
