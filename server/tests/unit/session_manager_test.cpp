#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "arbiter/match_error.hpp"
#include "arbiter/memory_match_store.hpp"
#include "arbiter/session_manager.hpp"

namespace {

std::shared_ptr<arbiter::SessionManager> MakeManager(std::size_t limit = arbiter::kDefaultMaxActiveMatches) {
  return std::make_shared<arbiter::SessionManager>(std::make_shared<arbiter::MemoryMatchStore>(), limit);
}

template <typename Fn>
std::string ErrorCodeOf(Fn&& fn) {
  try {
    fn();
  } catch (const arbiter::MatchError& ex) {
    return ex.code;
  }
  return "";
}

}  // namespace

TEST(SessionManagerTest, RejectsMissingStore) {
  EXPECT_THROW(arbiter::SessionManager(nullptr), std::invalid_argument);
}

TEST(SessionManagerTest, AdmissionCeiling) {
  auto manager = MakeManager(2);
  auto first = manager->Create("a", "b");
  manager->Create("c", "d");
  EXPECT_THROW(manager->Create("e", "f"), arbiter::CapacityExceededError);
  EXPECT_EQ(manager->CountActive(), 2u);

  manager->Resign(first.Id(), "a");
  EXPECT_EQ(manager->CountActive(), 1u);
  EXPECT_NO_THROW(manager->Create("e", "f"));
}

TEST(SessionManagerTest, PausedMatchesDoNotHoldASlot) {
  auto manager = MakeManager(1);
  auto match = manager->Create("a", "b");
  manager->Pause(match.Id(), "b");
  EXPECT_EQ(manager->CountActive(), 0u);
  auto other = manager->Create("c", "d");

  // 재개는 상한을 다시 확인하지 않는다.
  auto resumed = manager->Resume(match.Id());
  EXPECT_EQ(resumed.Status(), arbiter::MatchStatus::kActive);
  EXPECT_EQ(manager->CountActive(), 2u);
  EXPECT_THROW(manager->Create("e", "f"), arbiter::CapacityExceededError);
  EXPECT_TRUE(manager->Exists(other.Id()));
}

TEST(SessionManagerTest, ConcurrentCreatesNeverExceedCeiling) {
  auto manager = MakeManager(5);
  std::atomic<int> created{0};
  std::atomic<int> rejected{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 20; ++i) {
    threads.emplace_back([&, i]() {
      try {
        manager->Create("white-" + std::to_string(i), "black-" + std::to_string(i));
        created.fetch_add(1);
      } catch (const arbiter::CapacityExceededError&) {
        rejected.fetch_add(1);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(created.load(), 5);
  EXPECT_EQ(rejected.load(), 15);
  EXPECT_EQ(manager->CountActive(), 5u);
  EXPECT_EQ(manager->ListAll().size(), 5u);
}

TEST(SessionManagerTest, ConcurrentMovesBySameSideApplyOnce) {
  for (int round = 0; round < 10; ++round) {
    auto manager = MakeManager();
    auto match = manager->Create("alice", "bob");
    std::atomic<int> applied{0};
    std::atomic<int> refused{0};
    std::vector<std::thread> threads;
    for (const char* move : {"e4", "d4"}) {
      threads.emplace_back([&, move]() {
        try {
          manager->ApplyMove(match.Id(), move, std::string("alice"));
          applied.fetch_add(1);
        } catch (const arbiter::IllegalStateError& ex) {
          EXPECT_EQ(ex.code, "not_your_turn");
          refused.fetch_add(1);
        }
      });
    }
    for (auto& thread : threads) {
      thread.join();
    }
    EXPECT_EQ(applied.load(), 1);
    EXPECT_EQ(refused.load(), 1);
    EXPECT_EQ(manager->Get(match.Id())->MoveLog().size(), 1u);
  }
}

TEST(SessionManagerTest, MoveChecksParticipantAndTurn) {
  auto manager = MakeManager();
  auto match = manager->Create("alice", "bob");
  EXPECT_EQ(ErrorCodeOf([&] { manager->ApplyMove(match.Id(), "e4", std::string("mallory")); }), "not_participant");
  EXPECT_EQ(ErrorCodeOf([&] { manager->ApplyMove(match.Id(), "e5", std::string("bob")); }), "not_your_turn");
  EXPECT_EQ(ErrorCodeOf([&] { manager->ApplyMove("missing", "e4"); }), "match_not_found");

  auto outcome = manager->ApplyMove(match.Id(), "e2e4", std::string("alice"));
  EXPECT_EQ(outcome.san, "e4");
  EXPECT_EQ(outcome.match.TurnPlayerId(), "bob");
  EXPECT_THROW(manager->ApplyMove(match.Id(), "e4", std::string("bob")), arbiter::InvalidMoveError);
  EXPECT_EQ(manager->Get(match.Id())->MoveLog().size(), 1u);
}

TEST(SessionManagerTest, LockRegistryDoesNotGrowWithUnknownOrFinishedMatches) {
  auto manager = MakeManager();
  for (int i = 0; i < 1000; ++i) {
    const std::string id = "no-such-" + std::to_string(i);
    EXPECT_THROW(manager->Resign(id, "a"), arbiter::NotFoundError);
    EXPECT_THROW(manager->ApplyMove(id, "e4", std::string("a")), arbiter::NotFoundError);
  }
  EXPECT_EQ(manager->LockRegistrySize(), 0u);

  auto match = manager->Create("alice", "bob");
  manager->ApplyMove(match.Id(), "e4", std::string("alice"));
  EXPECT_THROW(manager->ApplyMove(match.Id(), "e5", std::string("alice")), arbiter::IllegalStateError);
  manager->Resign(match.Id(), "bob");
  EXPECT_EQ(manager->LockRegistrySize(), 0u);

  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&]() {
      for (int j = 0; j < 50; ++j) {
        manager->ValidateMove(match.Id(), "e5");
        EXPECT_THROW(manager->OfferDraw(match.Id(), "alice"), arbiter::IllegalStateError);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(manager->LockRegistrySize(), 0u);
  EXPECT_TRUE(manager->Delete(match.Id()));
  EXPECT_EQ(manager->LockRegistrySize(), 0u);
}

TEST(SessionManagerTest, FailedMutationLeavesStoreUnchanged) {
  auto manager = MakeManager();
  auto match = manager->Create("alice", "bob");
  manager->ApplyMove(match.Id(), "e4");
  EXPECT_THROW(manager->AcceptDraw(match.Id(), "bob"), arbiter::IllegalStateError);
  EXPECT_THROW(manager->ApplyMove(match.Id(), "e4"), arbiter::InvalidMoveError);
  auto stored = manager->Get(match.Id());
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->MoveLog().size(), 1u);
  EXPECT_EQ(stored->Status(), arbiter::MatchStatus::kActive);
}

TEST(SessionManagerTest, DeclineDrawRequiresParticipant) {
  auto manager = MakeManager();
  auto match = manager->Create("alice", "bob");
  manager->OfferDraw(match.Id(), "alice");
  EXPECT_EQ(ErrorCodeOf([&] { manager->DeclineDraw(match.Id(), "mallory"); }), "not_participant");
  auto declined = manager->DeclineDraw(match.Id(), "bob");
  EXPECT_FALSE(declined.DrawOfferFrom().has_value());
}

TEST(SessionManagerTest, ListingAndDelete) {
  auto manager = MakeManager();
  auto first = manager->Create("alice", "bob");
  auto second = manager->Create("carol", "alice");
  manager->Complete(second.Id(), arbiter::kDrawResult);

  EXPECT_EQ(manager->ListAll().size(), 2u);
  EXPECT_EQ(manager->ListByParticipant("alice").size(), 2u);
  EXPECT_EQ(manager->ListByParticipant("bob").size(), 1u);
  EXPECT_EQ(manager->ListByStatus(arbiter::MatchStatus::kCompleted).size(), 1u);

  EXPECT_TRUE(manager->Delete(first.Id()));
  EXPECT_FALSE(manager->Delete(first.Id()));
  EXPECT_FALSE(manager->Get(first.Id()).has_value());
  EXPECT_EQ(ErrorCodeOf([&] { manager->Resign(first.Id(), "alice"); }), "match_not_found");
}

TEST(SessionManagerTest, ReadOnlyQueries) {
  auto manager = MakeManager();
  auto match = manager->Create("alice", "bob");
  manager->ApplyMove(match.Id(), "e4");
  EXPECT_TRUE(manager->ValidateMove(match.Id(), "e5").valid);
  EXPECT_FALSE(manager->ValidateMove(match.Id(), "e4").valid);
  EXPECT_EQ(manager->LegalMoves(match.Id(), std::nullopt).size(), 20u);
  EXPECT_EQ(manager->LegalMoves(match.Id(), std::string("g8")).size(), 2u);
  EXPECT_EQ(manager->GetDrawStatus(match.Id())->halfmove_clock, 0);
  auto history = manager->GetMoveHistory(match.Id(), arbiter::HistoryFormat::kUci);
  EXPECT_EQ(std::get<arbiter::UciHistory>(history).moves.front(), "e2e4");
  EXPECT_EQ(manager->Export(match.Id(), arbiter::ExportFormat::kFen).content,
            manager->Get(match.Id())->Fen());
  EXPECT_EQ(ErrorCodeOf([&] { manager->ValidateMove("missing", "e4"); }), "match_not_found");
}

TEST(SessionManagerTest, ImportGoesThroughAdmission) {
  auto manager = MakeManager(1);
  manager->Create("a", "b");
  EXPECT_THROW(manager->Import("1. e4 e5 *", {}), arbiter::CapacityExceededError);

  auto finished = manager->Import("1. f3 e5 2. g4 Qh4# 0-1", {});
  EXPECT_EQ(finished.match.Status(), arbiter::MatchStatus::kCompleted);
  EXPECT_TRUE(manager->Exists(finished.match.Id()));
  EXPECT_EQ(manager->CountActive(), 1u);
}

TEST(SessionManagerTest, FullGameScenario) {
  auto manager = MakeManager();
  auto match = manager->Create("alice", "bob");
  const std::string id = match.Id();

  manager->ApplyMove(id, "e4", std::string("alice"));
  manager->ApplyMove(id, "e5", std::string("bob"));
  manager->OfferDraw(id, "alice");
  manager->DeclineDraw(id, "bob");
  manager->ApplyMove(id, "Nf3", std::string("alice"));
  manager->OfferDraw(id, "bob");
  auto paused = manager->Pause(id, "alice");
  EXPECT_FALSE(paused.DrawOfferFrom().has_value());
  EXPECT_EQ(ErrorCodeOf([&] { manager->ApplyMove(id, "Nc6", std::string("bob")); }), "paused");
  manager->Resume(id);
  manager->ApplyMove(id, "Nc6", std::string("bob"));
  auto resigned = manager->Resign(id, "alice");

  EXPECT_EQ(resigned.Status(), arbiter::MatchStatus::kCompleted);
  EXPECT_EQ(resigned.Result(), std::string("0-1"));
  EXPECT_EQ(resigned.MoveLog(), (std::vector<std::string>{"e4", "e5", "Nf3", "Nc6"}));
  EXPECT_EQ(manager->CountActive(), 0u);
  auto exported = manager->Export(id, arbiter::ExportFormat::kPgn);
  EXPECT_NE(exported.content.find("1. e4 e5 2. Nf3 Nc6 0-1"), std::string::npos);
}

TEST(SessionManagerTest, HealthAndClose) {
  auto manager = MakeManager();
  manager->Create("alice", "bob");
  EXPECT_TRUE(manager->HealthCheck());
  manager->Close();
  EXPECT_FALSE(manager->HealthCheck());
  EXPECT_TRUE(manager->ListAll().empty());
}
