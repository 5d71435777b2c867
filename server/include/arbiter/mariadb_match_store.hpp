/*
 * 설명: 매치 JSON 덤프를 MariaDB matches 테이블에 보관하는 영속 저장소.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/mariadb_match_store_it_test.cpp
 */
#pragma once

#include <atomic>
#include <functional>
#include <memory>

#include <mariadb/mysql.h>

#include "arbiter/db_client.hpp"
#include "arbiter/match_store.hpp"
#include "arbiter/observability.hpp"

namespace arbiter {

class MariaDbMatchStore : public MatchStore {
 public:
  MariaDbMatchStore(std::shared_ptr<MariaDbClient> db_client, std::shared_ptr<Observability> observability);

  void EnsureSchema();
  // 통합 테스트 격리용.
  void ClearAll();

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
  using WhereBuilder = std::function<std::string(MYSQL*)>;

  std::vector<Match> LoadWhere(const WhereBuilder& where);
  std::size_t CountWhere(const std::string& where);
  void RequireOpen() const;

  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<Observability> observability_;
  std::atomic<bool> closed_{false};
};

}  // namespace arbiter
