#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>

#include <gtest/gtest.h>
#include <mariadb/mysql.h>

#include "arbiter/mariadb_match_store.hpp"
#include "arbiter/session_manager.hpp"

namespace {

arbiter::DbConfig TestDbConfig() {
  arbiter::DbConfig cfg;
  const char* host = std::getenv("DB_HOST");
  const char* port = std::getenv("DB_PORT");
  const char* user = std::getenv("DB_USER");
  const char* pass = std::getenv("DB_PASSWORD");
  const char* name = std::getenv("DB_NAME");
  cfg.host = host ? host : "127.0.0.1";
  cfg.port = port ? static_cast<unsigned short>(std::stoi(port)) : 3306;
  cfg.user = user ? user : "app";
  cfg.password = pass ? pass : "app_pass";
  cfg.database = name ? name : "app_db";
  cfg.max_attempts = 1;
  return cfg;
}

class MariaDbMatchStoreIt : public ::testing::Test {
 protected:
  void SetUp() override {
    db_client_ = std::make_shared<arbiter::MariaDbClient>(TestDbConfig());
    store_ = std::make_shared<arbiter::MariaDbMatchStore>(db_client_, nullptr);
    try {
      store_->EnsureSchema();
      store_->ClearAll();
    } catch (const arbiter::DbException& ex) {
      GTEST_SKIP() << "MariaDB에 연결할 수 없습니다: " << ex.what();
    }
  }

  void InsertRaw(const std::string& id, const std::string& data) {
    db_client_->WithConnectionRetry([&](MYSQL* conn) {
      db_client_->Execute(conn,
                          "INSERT INTO matches(id, data, status, white_player_id, black_player_id, created_at, "
                          "updated_at) VALUES('" +
                              db_client_->Escape(conn, id) + "', '" + db_client_->Escape(conn, data) +
                              "', 'active', 'alice', 'zed', NOW(3), NOW(3));",
                          "테스트 행 삽입 실패");
    });
  }

  static void Tick() { std::this_thread::sleep_for(std::chrono::milliseconds(5)); }

  std::shared_ptr<arbiter::MariaDbClient> db_client_;
  std::shared_ptr<arbiter::MariaDbMatchStore> store_;
};

}  // namespace

TEST_F(MariaDbMatchStoreIt, SaveLoadAndUpsert) {
  arbiter::Match match("alice", "bob");
  store_->Save(match);
  ASSERT_TRUE(store_->Exists(match.Id()));

  match.ApplyMove("e4");
  match.ApplyMove("e5");
  store_->Save(match);

  auto loaded = store_->Load(match.Id());
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->Fen(), match.Fen());
  EXPECT_EQ(loaded->MoveLog(), match.MoveLog());
  EXPECT_EQ(loaded->UpdatedAt(), match.UpdatedAt());
  EXPECT_EQ(store_->LoadAll().size(), 1u);

  EXPECT_TRUE(store_->Delete(match.Id()));
  EXPECT_FALSE(store_->Delete(match.Id()));
  EXPECT_FALSE(store_->Load(match.Id()).has_value());
}

TEST_F(MariaDbMatchStoreIt, ListingFiltersAndOrder) {
  arbiter::Match first("alice", "bob");
  store_->Save(first);
  Tick();
  arbiter::Match second("carol", "alice");
  second.Resign("carol");
  store_->Save(second);
  Tick();
  arbiter::Match third("dave", "erin");
  store_->Save(third);

  auto all = store_->LoadAll();
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].Id(), third.Id());
  EXPECT_EQ(all[2].Id(), first.Id());

  auto alice = store_->LoadByParticipant("alice");
  ASSERT_EQ(alice.size(), 2u);
  EXPECT_EQ(alice[0].Id(), second.Id());

  auto completed = store_->LoadByStatus(arbiter::MatchStatus::kCompleted);
  ASSERT_EQ(completed.size(), 1u);
  EXPECT_EQ(completed[0].Result(), std::string("0-1"));
  EXPECT_EQ(store_->CountActive(), 2u);
}

TEST_F(MariaDbMatchStoreIt, CorruptRowsAreSkippedInListings) {
  arbiter::Match healthy("alice", "bob");
  store_->Save(healthy);
  InsertRaw("corrupt-row", "{\"id\":\"corrupt-row\"}");
  InsertRaw("garbage-row", "not json");

  auto alice = store_->LoadByParticipant("alice");
  ASSERT_EQ(alice.size(), 1u);
  EXPECT_EQ(alice[0].Id(), healthy.Id());
  EXPECT_THROW(store_->Load("corrupt-row"), arbiter::CorruptStateError);
  EXPECT_THROW(store_->Load("garbage-row"), arbiter::CorruptStateError);
}

TEST_F(MariaDbMatchStoreIt, SessionManagerAdmissionOverDatabase) {
  arbiter::SessionManager manager(store_, 2);
  auto match = manager.Create("alice", "bob");
  manager.Create("carol", "dave");
  EXPECT_THROW(manager.Create("erin", "frank"), arbiter::CapacityExceededError);

  manager.ApplyMove(match.Id(), "e4", std::string("alice"));
  manager.Pause(match.Id(), "bob");
  EXPECT_EQ(store_->CountActive(), 1u);
  EXPECT_NO_THROW(manager.Create("erin", "frank"));

  EXPECT_TRUE(manager.HealthCheck());
  manager.Close();
  EXPECT_FALSE(store_->HealthCheck());
  EXPECT_THROW(store_->LoadAll(), arbiter::DbException);
}

TEST_F(MariaDbMatchStoreIt, TransientErrorsAreRetried) {
  auto cfg = TestDbConfig();
  cfg.max_attempts = 3;
  auto retrying_client = std::make_shared<arbiter::MariaDbClient>(cfg);
  retrying_client->SetTransientInjector([](std::size_t attempt) { return attempt < 3; });
  arbiter::MariaDbMatchStore retrying_store(retrying_client, nullptr);

  arbiter::Match match("alice", "bob");
  EXPECT_NO_THROW(retrying_store.Save(match));
  EXPECT_TRUE(store_->Exists(match.Id()));

  auto failing_client = std::make_shared<arbiter::MariaDbClient>(cfg);
  failing_client->SetTransientInjector([](std::size_t) { return true; });
  arbiter::MariaDbMatchStore failing_store(failing_client, nullptr);
  try {
    failing_store.Save(arbiter::Match("carol", "dave"));
    FAIL() << "재시도 한도를 넘으면 예외가 나야 합니다";
  } catch (const arbiter::DbException& ex) {
    EXPECT_TRUE(ex.retryable);
    EXPECT_EQ(ex.code, 1213u);
  }
  EXPECT_EQ(store_->LoadAll().size(), 1u);
}
