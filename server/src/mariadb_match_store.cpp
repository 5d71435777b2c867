/*
 * 설명: matches 테이블 스키마 생성, upsert 저장, 조회/목록/카운트를 MariaDB로 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/mariadb_match_store_it_test.cpp
 */
#include "arbiter/mariadb_match_store.hpp"

#include <sstream>

namespace arbiter {
namespace {
// 2024-05-01T12:00:00.123Z -> 2024-05-01 12:00:00.123
std::string ToSqlTimestamp(Timestamp ts) {
  std::string text = FormatTimestamp(ts);
  text[10] = ' ';
  text.pop_back();
  return text;
}

constexpr const char* kSelectColumns = "SELECT id, data FROM matches";
constexpr const char* kOrderBy = " ORDER BY updated_at DESC, id ASC";
}  // namespace

MariaDbMatchStore::MariaDbMatchStore(std::shared_ptr<MariaDbClient> db_client,
                                     std::shared_ptr<Observability> observability)
    : db_client_(std::move(db_client)), observability_(std::move(observability)) {}

void MariaDbMatchStore::EnsureSchema() {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    db_client_->Execute(conn,
                        "CREATE TABLE IF NOT EXISTS matches ("
                        "id VARCHAR(36) NOT NULL PRIMARY KEY,"
                        "data LONGTEXT NOT NULL,"
                        "status VARCHAR(16) NOT NULL,"
                        "white_player_id VARCHAR(255) NOT NULL,"
                        "black_player_id VARCHAR(255) NOT NULL,"
                        "created_at DATETIME(3) NOT NULL,"
                        "updated_at DATETIME(3) NOT NULL,"
                        "INDEX idx_matches_status (status),"
                        "INDEX idx_matches_white (white_player_id),"
                        "INDEX idx_matches_black (black_player_id),"
                        "INDEX idx_matches_updated (updated_at)"
                        ") ENGINE=InnoDB DEFAULT CHARSET=utf8mb4;",
                        "matches 테이블 생성 실패");
  });
}

void MariaDbMatchStore::ClearAll() {
  db_client_->WithConnectionRetry(
      [&](MYSQL* conn) { db_client_->Execute(conn, "DELETE FROM matches;", "matches 초기화 실패"); });
}

void MariaDbMatchStore::RequireOpen() const {
  if (closed_.load()) {
    throw DbException("닫힌 저장소입니다", 0, false);
  }
}

void MariaDbMatchStore::Save(const Match& match) {
  RequireOpen();
  const std::string data = match.ToJson().dump();
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "INSERT INTO matches(id, data, status, white_player_id, black_player_id, created_at, updated_at) VALUES('"
        << db_client_->Escape(conn, match.Id()) << "', '" << db_client_->Escape(conn, data) << "', '"
        << ToString(match.Status()) << "', '" << db_client_->Escape(conn, match.WhitePlayerId()) << "', '"
        << db_client_->Escape(conn, match.BlackPlayerId()) << "', '" << ToSqlTimestamp(match.CreatedAt()) << "', '"
        << ToSqlTimestamp(match.UpdatedAt()) << "') "
        << "ON DUPLICATE KEY UPDATE data=VALUES(data), status=VALUES(status), updated_at=VALUES(updated_at);";
    db_client_->Execute(conn, oss.str(), "매치 저장 실패");
    return true;
  });
}

std::optional<Match> MariaDbMatchStore::Load(const std::string& id) {
  RequireOpen();
  std::optional<std::string> data;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    data.reset();
    std::ostringstream oss;
    oss << "SELECT data FROM matches WHERE id='" << db_client_->Escape(conn, id) << "';";
    auto res = db_client_->Query(conn, oss.str(), "매치 조회 실패");
    MYSQL_ROW row = mysql_fetch_row(res.get());
    if (row && row[0]) {
      data = row[0];
    }
  });
  if (!data) {
    return std::nullopt;
  }
  nlohmann::json json = nlohmann::json::parse(*data, nullptr, false);
  if (json.is_discarded()) {
    throw CorruptStateError("invalid_record", "저장된 매치 JSON을 해석할 수 없습니다: " + id);
  }
  return Match::FromJson(json);
}

bool MariaDbMatchStore::Delete(const std::string& id) {
  RequireOpen();
  bool deleted = false;
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "DELETE FROM matches WHERE id='" << db_client_->Escape(conn, id) << "';";
    db_client_->Execute(conn, oss.str(), "매치 삭제 실패");
    deleted = mysql_affected_rows(conn) > 0;
    return true;
  });
  return deleted;
}

bool MariaDbMatchStore::Exists(const std::string& id) {
  RequireOpen();
  bool exists = false;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT 1 FROM matches WHERE id='" << db_client_->Escape(conn, id) << "' LIMIT 1;";
    auto res = db_client_->Query(conn, oss.str(), "매치 존재 확인 실패");
    exists = mysql_fetch_row(res.get()) != nullptr;
  });
  return exists;
}

std::vector<Match> MariaDbMatchStore::LoadWhere(const WhereBuilder& where) {
  RequireOpen();
  std::vector<std::pair<std::string, std::string>> rows;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    rows.clear();
    std::string sql = std::string(kSelectColumns) + where(conn) + kOrderBy + ";";
    auto res = db_client_->Query(conn, sql, "매치 목록 조회 실패");
    while (MYSQL_ROW row = mysql_fetch_row(res.get())) {
      rows.emplace_back(row[0] ? row[0] : "", row[1] ? row[1] : "");
    }
  });

  std::vector<Match> matches;
  matches.reserve(rows.size());
  for (const auto& [id, data] : rows) {
    try {
      nlohmann::json json = nlohmann::json::parse(data, nullptr, false);
      if (json.is_discarded()) {
        throw CorruptStateError("invalid_record", "저장된 매치 JSON을 해석할 수 없습니다");
      }
      matches.push_back(Match::FromJson(json));
    } catch (const CorruptStateError& ex) {
      if (observability_) {
        LogContext ctx;
        ctx.trace_id = observability_->NextTraceId();
        ctx.name = "store.skip_corrupt";
        ctx.level = LogLevel::kWarn;
        ctx.match_id = id;
        ctx.error_code = ex.code;
        ctx.message = ex.what();
        observability_->Log(ctx);
      }
    }
  }
  return matches;
}

std::vector<Match> MariaDbMatchStore::LoadAll() {
  return LoadWhere([](MYSQL*) { return std::string(); });
}

std::vector<Match> MariaDbMatchStore::LoadByStatus(MatchStatus status) {
  return LoadWhere([status](MYSQL*) { return " WHERE status='" + std::string(ToString(status)) + "'"; });
}

std::vector<Match> MariaDbMatchStore::LoadByParticipant(const std::string& participant_id) {
  return LoadWhere([&](MYSQL* conn) {
    const std::string escaped = db_client_->Escape(conn, participant_id);
    return " WHERE white_player_id='" + escaped + "' OR black_player_id='" + escaped + "'";
  });
}

std::size_t MariaDbMatchStore::CountWhere(const std::string& where) {
  RequireOpen();
  std::size_t count = 0;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    auto res = db_client_->Query(conn, "SELECT COUNT(*) FROM matches" + where + ";", "매치 카운트 실패");
    MYSQL_ROW row = mysql_fetch_row(res.get());
    count = row && row[0] ? static_cast<std::size_t>(std::stoull(row[0])) : 0;
  });
  return count;
}

std::size_t MariaDbMatchStore::CountActive() { return CountWhere(" WHERE status='active'"); }

bool MariaDbMatchStore::HealthCheck() {
  if (closed_.load()) {
    return false;
  }
  try {
    db_client_->WithConnectionRetry([&](MYSQL* conn) { db_client_->Query(conn, "SELECT 1;", "헬스체크 실패"); });
    return true;
  } catch (const DbException& ex) {
    if (observability_) {
      LogContext ctx;
      ctx.trace_id = observability_->NextTraceId();
      ctx.name = "store.health_failed";
      ctx.level = LogLevel::kWarn;
      ctx.error_code = std::to_string(ex.code);
      ctx.message = ex.what();
      observability_->Log(ctx);
    }
    return false;
  }
}

void MariaDbMatchStore::Close() { closed_.store(true); }

}  // namespace arbiter
