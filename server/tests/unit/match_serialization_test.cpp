#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "arbiter/match.hpp"
#include "arbiter/match_error.hpp"

namespace {

std::string CorruptCodeOf(const nlohmann::json& json) {
  try {
    arbiter::Match::FromJson(json);
  } catch (const arbiter::CorruptStateError& ex) {
    return ex.code;
  }
  return "";
}

arbiter::Match SampleMatch() {
  arbiter::Match match("alice", "bob", arbiter::TimeControl{arbiter::TimeControlType::kFixed, 600, std::nullopt});
  for (const char* move : {"e4", "c5", "Nf3", "d6"}) {
    match.ApplyMove(move);
  }
  return match;
}

}  // namespace

TEST(MatchSerializationTest, ToJsonShape) {
  auto json = SampleMatch().ToJson();
  for (const char* key : {"id", "whitePlayerId", "blackPlayerId", "status", "fen", "pgn", "turn", "result",
                          "drawDetails", "positionHistory", "drawOfferFrom", "pauseRequestedBy", "createdAt",
                          "updatedAt", "lastMoveAt", "timeControl", "whiteTimeRemaining", "blackTimeRemaining",
                          "moveHistory"}) {
    EXPECT_TRUE(json.contains(key)) << key;
  }
  EXPECT_EQ(json["status"], "active");
  EXPECT_EQ(json["turn"], "white");
  EXPECT_TRUE(json["result"].is_null());
  EXPECT_TRUE(json["drawOfferFrom"].is_null());
  EXPECT_EQ(json["pgn"], "1. e4 c5 2. Nf3 d6 *");
  EXPECT_EQ(json["timeControl"]["type"], "fixed");
  EXPECT_EQ(json["timeControl"]["initialTime"], 600);
  EXPECT_TRUE(json["timeControl"]["increment"].is_null());
  EXPECT_EQ(json["whiteTimeRemaining"], 600);
  EXPECT_EQ(json["moveHistory"].size(), 4u);
  EXPECT_EQ(json["positionHistory"].size(), 5u);
}

TEST(MatchSerializationTest, RestoreReproducesState) {
  auto original = SampleMatch();
  original.OfferDraw("bob");
  auto restored = arbiter::Match::FromJson(original.ToJson());

  EXPECT_EQ(restored.Id(), original.Id());
  EXPECT_EQ(restored.Fen(), original.Fen());
  EXPECT_EQ(restored.MoveLog(), original.MoveLog());
  EXPECT_EQ(restored.PositionHistory(), original.PositionHistory());
  EXPECT_EQ(restored.DrawOfferFrom(), original.DrawOfferFrom());
  EXPECT_EQ(restored.CreatedAt(), original.CreatedAt());
  EXPECT_EQ(restored.UpdatedAt(), original.UpdatedAt());
  EXPECT_EQ(restored.LastMoveAt(), original.LastMoveAt());
  EXPECT_EQ(restored.WhiteTimeRemaining(), original.WhiteTimeRemaining());
  EXPECT_EQ(restored.ToJson(), original.ToJson());

  // 복원된 매치는 이어서 둘 수 있어야 한다.
  EXPECT_EQ(restored.ApplyMove("d4"), "d4");
  EXPECT_EQ(original.MoveLog().size(), 4u);
}

TEST(MatchSerializationTest, RestoreCompletedAndPausedMatches) {
  arbiter::Match drawn("alice", "bob");
  drawn.OfferDraw("alice");
  drawn.AcceptDraw("bob");
  auto restored_draw = arbiter::Match::FromJson(drawn.ToJson());
  EXPECT_EQ(restored_draw.Status(), arbiter::MatchStatus::kCompleted);
  ASSERT_TRUE(restored_draw.Draw().has_value());
  EXPECT_EQ(restored_draw.Draw()->type, arbiter::DrawType::kAgreement);
  EXPECT_EQ(restored_draw.Draw()->description, drawn.Draw()->description);

  auto paused = SampleMatch();
  paused.Pause("alice");
  auto restored_pause = arbiter::Match::FromJson(paused.ToJson());
  EXPECT_EQ(restored_pause.Status(), arbiter::MatchStatus::kPaused);
  EXPECT_EQ(restored_pause.PauseRequestedBy(), std::string("alice"));
}

TEST(MatchSerializationTest, RejectsInconsistentRecords) {
  auto json = SampleMatch().ToJson();

  EXPECT_EQ(CorruptCodeOf(nlohmann::json::array()), "invalid_record");

  auto missing = json;
  missing.erase("fen");
  EXPECT_EQ(CorruptCodeOf(missing), "missing_field");

  auto wrong_fen = json;
  wrong_fen["fen"] = arbiter::chess::kStartFen;
  EXPECT_EQ(CorruptCodeOf(wrong_fen), "position_mismatch");

  auto bad_move = json;
  bad_move["moveHistory"].push_back("Ke8");
  EXPECT_EQ(CorruptCodeOf(bad_move), "replay_failed");

  auto bad_status = json;
  bad_status["status"] = "completed";
  EXPECT_EQ(CorruptCodeOf(bad_status), "status_mismatch");

  auto stray_pause = json;
  stray_pause["pauseRequestedBy"] = "alice";
  EXPECT_EQ(CorruptCodeOf(stray_pause), "status_mismatch");

  auto no_start = json;
  no_start["positionHistory"].erase(arbiter::Match::Fingerprint(arbiter::chess::kStartFen));
  EXPECT_EQ(CorruptCodeOf(no_start), "invalid_field");

  auto lost_current = json;
  lost_current["positionHistory"].erase(arbiter::Match::Fingerprint(json["fen"].get<std::string>()));
  EXPECT_EQ(CorruptCodeOf(lost_current), "position_mismatch");

  auto inflated = json;
  inflated["positionHistory"][arbiter::Match::Fingerprint(arbiter::chess::kStartFen)] = 3;
  EXPECT_EQ(CorruptCodeOf(inflated), "position_mismatch");

  auto bad_time = json;
  bad_time["createdAt"] = "yesterday";
  EXPECT_EQ(CorruptCodeOf(bad_time), "invalid_field");

  auto bad_type = json;
  bad_type["whiteTimeRemaining"] = "lots";
  EXPECT_EQ(CorruptCodeOf(bad_type), "invalid_field");
}

TEST(MatchSerializationTest, TimestampFormatting) {
  arbiter::Timestamp ts{std::chrono::milliseconds(1700000000123LL)};
  EXPECT_EQ(arbiter::FormatTimestamp(ts), "2023-11-14T22:13:20.123Z");
  EXPECT_EQ(arbiter::ParseTimestamp("2023-11-14T22:13:20.123Z"), ts);
  EXPECT_EQ(arbiter::ParseTimestamp("2023-11-14T22:13:20Z"), arbiter::Timestamp{std::chrono::milliseconds(1700000000000LL)});
  EXPECT_FALSE(arbiter::ParseTimestamp("not a time").has_value());
  EXPECT_FALSE(arbiter::ParseTimestamp("2023-11-14T22:13:20.123Z trailing").has_value());
}
