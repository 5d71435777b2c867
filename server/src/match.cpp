/*
 * 설명: 매치 상태 머신, 무승부 집계, 수 기록/내보내기, PGN 가져오기, JSON 덤프/복원을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/match_state_test.cpp, server/tests/unit/draw_detection_test.cpp,
 *         server/tests/unit/match_serialization_test.cpp
 */
#include "arbiter/match.hpp"

#include <array>
#include <iomanip>
#include <sstream>

#include <openssl/rand.h>

#include "arbiter/chess/pgn.hpp"

namespace arbiter {
namespace {
constexpr std::size_t kSuggestionCount = 5;
constexpr int kFiftyMoveWarningPlies = 80;

std::string ColorName(chess::Color color) { return color == chess::Color::kWhite ? "white" : "black"; }

const nlohmann::json& Field(const nlohmann::json& json, const char* key) {
  auto it = json.find(key);
  if (it == json.end()) {
    throw CorruptStateError("missing_field", std::string("저장된 매치에 필드가 없습니다: ") + key);
  }
  return *it;
}

std::string StringField(const nlohmann::json& json, const char* key) {
  const auto& value = Field(json, key);
  if (!value.is_string()) {
    throw CorruptStateError("invalid_field", std::string("문자열 필드가 아닙니다: ") + key);
  }
  return value.get<std::string>();
}

std::optional<std::string> OptionalString(const nlohmann::json& json, const char* key) {
  auto it = json.find(key);
  if (it == json.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_string()) {
    throw CorruptStateError("invalid_field", std::string("문자열 필드가 아닙니다: ") + key);
  }
  return it->get<std::string>();
}

std::optional<long> OptionalInteger(const nlohmann::json& json, const char* key) {
  auto it = json.find(key);
  if (it == json.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_number_integer()) {
    throw CorruptStateError("invalid_field", std::string("정수 필드가 아닙니다: ") + key);
  }
  return it->get<long>();
}

Timestamp TimestampField(const nlohmann::json& json, const char* key) {
  auto parsed = ParseTimestamp(StringField(json, key));
  if (!parsed) {
    throw CorruptStateError("invalid_field", std::string("시각 형식이 올바르지 않습니다: ") + key);
  }
  return *parsed;
}

std::optional<Timestamp> OptionalTimestamp(const nlohmann::json& json, const char* key) {
  auto text = OptionalString(json, key);
  if (!text) {
    return std::nullopt;
  }
  auto parsed = ParseTimestamp(*text);
  if (!parsed) {
    throw CorruptStateError("invalid_field", std::string("시각 형식이 올바르지 않습니다: ") + key);
  }
  return parsed;
}

template <typename T>
nlohmann::json OptionalToJson(const std::optional<T>& value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

nlohmann::json DrawDetailsToJson(const DrawDetails& details) {
  return {{"type", ToString(details.type)},
          {"description", details.description},
          {"halfmoveClock", OptionalToJson(details.halfmove_clock)},
          {"repetitionCount", OptionalToJson(details.repetition_count)}};
}

nlohmann::json TimeControlToJson(const TimeControl& tc) {
  return {{"type", ToString(tc.type)},
          {"initialTime", OptionalToJson(tc.initial_time)},
          {"increment", OptionalToJson(tc.increment)}};
}

// 시작 국면부터 SAN 목록을 재생하며 각 수 직후의 보드를 전달한다.
template <typename Visitor>
void Replay(const std::vector<std::string>& moves, Visitor&& visit) {
  chess::Board board;
  for (std::size_t i = 0; i < moves.size(); ++i) {
    auto move = board.ParseMove(moves[i]);
    if (!move) {
      throw CorruptStateError("replay_failed", "기록된 수를 재생할 수 없습니다: " + moves[i]);
    }
    const chess::Move applied = *move;
    board.Apply(applied);
    visit(i, applied, board);
  }
}

std::string DateOnly(Timestamp ts, char separator) {
  std::string date = FormatTimestamp(ts).substr(0, 10);
  if (separator != '-') {
    for (auto& c : date) {
      if (c == '-') {
        c = separator;
      }
    }
  }
  return date;
}
}  // namespace

std::string GenerateMatchId() {
  std::array<unsigned char, 16> bytes{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    throw std::runtime_error("매치 ID 난수 생성 실패");
  }
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40);
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80);
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      oss << '-';
    }
    oss << std::setw(2) << static_cast<int>(bytes[i]);
  }
  return oss.str();
}

Match::Match(std::string white_player_id, std::string black_player_id, std::optional<TimeControl> time_control)
    : id_(GenerateMatchId()),
      white_player_id_(std::move(white_player_id)),
      black_player_id_(std::move(black_player_id)),
      time_control_(std::move(time_control)) {
  if (white_player_id_.empty() || black_player_id_.empty()) {
    throw InvalidArgumentError("invalid_participant", "참가자 ID는 비어 있을 수 없습니다");
  }
  if (time_control_) {
    if ((time_control_->initial_time && *time_control_->initial_time < 0) ||
        (time_control_->increment && *time_control_->increment < 0)) {
      throw InvalidArgumentError("invalid_time_control", "시간 제어 값은 음수일 수 없습니다");
    }
    if (time_control_->initial_time) {
      white_time_remaining_ = time_control_->initial_time;
      black_time_remaining_ = time_control_->initial_time;
    }
  }
  fen_ = board_.Fen();
  position_history_[Fingerprint(fen_)] = 1;
  created_at_ = NowMillis();
  updated_at_ = created_at_;
}

std::string Match::Fingerprint(const std::string& fen) {
  std::istringstream iss(fen);
  std::string field;
  std::string key;
  for (int i = 0; i < 4 && iss >> field; ++i) {
    if (!key.empty()) {
      key.push_back(' ');
    }
    key += field;
  }
  return key;
}

std::string Match::NotationLog() const { return chess::WriteMovetext(move_log_, result_.value_or("*")); }

const std::string& Match::TurnPlayerId() const {
  return Turn() == chess::Color::kWhite ? white_player_id_ : black_player_id_;
}

bool Match::IsParticipant(const std::string& participant_id) const {
  return participant_id == white_player_id_ || participant_id == black_player_id_;
}

int Match::RepetitionCount() const {
  auto it = position_history_.find(Fingerprint(fen_));
  return it == position_history_.end() ? 0 : it->second;
}

void Match::RequireParticipant(const std::string& participant_id) const {
  if (!IsParticipant(participant_id)) {
    throw InvalidArgumentError("not_participant", "매치 참가자가 아닙니다: " + participant_id);
  }
}

void Match::RequireActive(const char* action) const {
  if (status_ == MatchStatus::kPaused) {
    throw IllegalStateError("paused", std::string("일시정지된 매치에서는 할 수 없습니다: ") + action);
  }
  if (status_ != MatchStatus::kActive) {
    throw IllegalStateError("inactive", std::string("진행 중이 아닌 매치에서는 할 수 없습니다: ") + action);
  }
}

std::string Match::Suggestion() const {
  auto legal = LegalMoves();
  if (legal.empty()) {
    return "둘 수 있는 합법 수가 없습니다";
  }
  std::string text = "다음 수 중 하나를 시도하세요: ";
  for (std::size_t i = 0; i < legal.size() && i < kSuggestionCount; ++i) {
    if (i > 0) {
      text += ", ";
    }
    text += legal[i];
  }
  if (legal.size() > kSuggestionCount) {
    text += "...";
  }
  return text;
}

std::string Match::ApplyMove(const std::string& move_text) {
  RequireActive("move");
  auto move = board_.ParseMove(move_text);
  if (!move) {
    throw InvalidMoveError("현재 국면에서 둘 수 없는 수입니다: \"" + move_text + "\"", Suggestion());
  }

  std::string san = board_.ToSan(*move);
  board_.Apply(*move);
  fen_ = board_.Fen();
  move_log_.push_back(san);
  auto now = NowMillis();
  last_move_at_ = now;
  updated_at_ = now;
  ++position_history_[Fingerprint(fen_)];
  // 수를 두면 대기 중인 무승부 제안은 거절된 것으로 본다.
  draw_offer_from_.reset();

  CompleteIfGameOver();
  return san;
}

void Match::CompleteIfGameOver() {
  if (board_.IsCheckmate()) {
    CompleteGame(board_.SideToMove() == chess::Color::kWhite ? kBlackWins : kWhiteWins);
    return;
  }
  DrawDetails details;
  if (board_.IsStalemate()) {
    details.type = DrawType::kStalemate;
    details.description = "Draw by stalemate";
  } else if (board_.IsInsufficientMaterial()) {
    details.type = DrawType::kInsufficientMaterial;
    details.description = "Draw by insufficient material";
  } else if (board_.IsFiftyMoveDraw()) {
    details.type = DrawType::kFiftyMove;
    details.description = "Draw by fifty-move rule";
    details.halfmove_clock = board_.HalfmoveClock();
  } else {
    return;
  }
  CompleteGame(kDrawResult, std::move(details));
}

MoveValidation Match::ValidateMove(const std::string& move_text) const {
  MoveValidation validation;
  if (status_ == MatchStatus::kPaused) {
    validation.reason = "매치가 일시정지 상태입니다";
    validation.suggestion = "수를 두려면 먼저 매치를 재개하세요";
    return validation;
  }
  if (status_ != MatchStatus::kActive) {
    validation.reason = "진행 중이 아닌 매치에서는 수를 검증할 수 없습니다";
    validation.suggestion = "진행 중인 매치에서만 수를 검증할 수 있습니다";
    return validation;
  }
  if (board_.ParseMove(move_text)) {
    validation.valid = true;
    return validation;
  }
  validation.reason = "현재 국면에서 둘 수 없는 수입니다: \"" + move_text + "\"";
  validation.suggestion = Suggestion();
  return validation;
}

std::optional<DrawStatus> Match::GetDrawStatus() const {
  if (status_ != MatchStatus::kActive) {
    return std::nullopt;
  }
  DrawStatus status;
  status.halfmove_clock = board_.HalfmoveClock();
  status.moves_until_fifty_move = 50 - status.halfmove_clock / 2;
  status.repetition_count = RepetitionCount();
  status.is_approaching_fifty_move = status.halfmove_clock >= kFiftyMoveWarningPlies;
  status.is_approaching_repetition = status.repetition_count >= 2;
  return status;
}

void Match::CompleteGame(const std::string& result, std::optional<DrawDetails> details) {
  if (status_ == MatchStatus::kCompleted) {
    throw IllegalStateError("completed", "이미 종료된 매치입니다");
  }
  if (status_ == MatchStatus::kPaused) {
    throw IllegalStateError("paused", "일시정지된 매치는 재개한 뒤에만 종료할 수 있습니다");
  }
  if (!IsFinalResult(result)) {
    throw InvalidArgumentError("invalid_result", "결과는 1-0, 0-1, 1/2-1/2 중 하나여야 합니다: " + result);
  }
  if (details && result != kDrawResult) {
    throw InvalidArgumentError("invalid_result", "무승부 정보는 무승부 결과에만 붙일 수 있습니다");
  }
  if (!details && result == kDrawResult && RepetitionCount() >= 3) {
    details = DrawDetails{DrawType::kThreefoldRepetition, "Draw by threefold repetition", std::nullopt,
                          RepetitionCount()};
  }
  status_ = MatchStatus::kCompleted;
  result_ = result;
  draw_details_ = std::move(details);
  draw_offer_from_.reset();
  updated_at_ = NowMillis();
}

void Match::Resign(const std::string& participant_id) {
  RequireActive("resign");
  RequireParticipant(participant_id);
  CompleteGame(participant_id == white_player_id_ ? kBlackWins : kWhiteWins);
}

void Match::OfferDraw(const std::string& participant_id) {
  RequireActive("offer_draw");
  RequireParticipant(participant_id);
  draw_offer_from_ = participant_id;
  updated_at_ = NowMillis();
}

void Match::AcceptDraw(const std::string& participant_id) {
  RequireActive("accept_draw");
  if (!draw_offer_from_) {
    throw IllegalStateError("no_draw_offer", "수락할 무승부 제안이 없습니다");
  }
  RequireParticipant(participant_id);
  if (participant_id == *draw_offer_from_) {
    throw IllegalStateError("own_draw_offer", "자신의 무승부 제안은 수락할 수 없습니다");
  }
  DrawDetails details;
  details.type = DrawType::kAgreement;
  details.description = "Draw by mutual agreement";
  CompleteGame(kDrawResult, std::move(details));
}

void Match::DeclineDraw() {
  if (!draw_offer_from_) {
    throw IllegalStateError("no_draw_offer", "거절할 무승부 제안이 없습니다");
  }
  draw_offer_from_.reset();
  updated_at_ = NowMillis();
}

void Match::Pause(const std::string& participant_id) {
  if (status_ == MatchStatus::kCompleted) {
    throw IllegalStateError("completed", "종료된 매치는 일시정지할 수 없습니다");
  }
  if (status_ == MatchStatus::kPaused) {
    throw IllegalStateError("already_paused", "이미 일시정지된 매치입니다");
  }
  RequireParticipant(participant_id);
  status_ = MatchStatus::kPaused;
  pause_requested_by_ = participant_id;
  // 일시정지 상태에서는 무승부 제안이 유지될 수 없다.
  draw_offer_from_.reset();
  updated_at_ = NowMillis();
}

void Match::Resume() {
  if (status_ == MatchStatus::kCompleted) {
    throw IllegalStateError("completed", "종료된 매치는 재개할 수 없습니다");
  }
  if (status_ != MatchStatus::kPaused) {
    throw IllegalStateError("not_paused", "일시정지된 매치가 아닙니다");
  }
  status_ = MatchStatus::kActive;
  pause_requested_by_.reset();
  updated_at_ = NowMillis();
}

std::vector<std::string> Match::LegalMoves() const {
  std::vector<std::string> moves;
  for (const auto& move : board_.LegalMoves()) {
    moves.push_back(board_.ToSan(move));
  }
  return moves;
}

std::vector<std::string> Match::LegalMovesFrom(const std::string& square) const {
  auto index = chess::ParseSquare(square);
  if (!index) {
    throw InvalidArgumentError("invalid_square", "칸 표기가 올바르지 않습니다: " + square);
  }
  std::vector<std::string> moves;
  for (const auto& move : board_.LegalMovesFrom(*index)) {
    moves.push_back(board_.ToSan(move));
  }
  return moves;
}

MoveHistory Match::GetMoveHistory(HistoryFormat format) const {
  switch (format) {
    case HistoryFormat::kAlgebraic:
      return AlgebraicHistory{move_log_};
    case HistoryFormat::kUci: {
      UciHistory history;
      Replay(move_log_, [&](std::size_t, const chess::Move& move, const chess::Board&) {
        history.moves.push_back(chess::Board::ToUci(move));
      });
      return history;
    }
    case HistoryFormat::kVerbose: {
      VerboseHistory history;
      for (std::size_t i = 0; i < move_log_.size(); ++i) {
        VerboseEntry entry;
        entry.move_number = static_cast<int>(i / 2) + 1;
        entry.player = i % 2 == 0 ? "white" : "black";
        entry.move = move_log_[i];
        entry.timestamp = last_move_at_;
        history.entries.push_back(std::move(entry));
      }
      return history;
    }
    case HistoryFormat::kWithFen: {
      WithFenHistory history;
      Replay(move_log_, [&](std::size_t i, const chess::Move&, const chess::Board& board) {
        history.entries.push_back(FenEntry{static_cast<int>(i) + 1, move_log_[i], board.Fen()});
      });
      return history;
    }
    case HistoryFormat::kDetailed: {
      DetailedHistory history;
      Replay(move_log_, [&](std::size_t i, const chess::Move& move, const chess::Board& board) {
        DetailedEntry entry;
        entry.move_number = static_cast<int>(i) + 1;
        entry.move = move_log_[i];
        entry.fen = board.Fen();
        entry.check = board.InCheck();
        entry.capture = move.capture;
        entry.castling = move.castle;
        history.entries.push_back(std::move(entry));
      });
      return history;
    }
  }
  return AlgebraicHistory{move_log_};
}

GameExport Match::Export(ExportFormat format) const {
  GameExport out;
  out.match_id = id_;
  out.format = format;
  out.white_player = white_player_id_;
  out.black_player = black_player_id_;
  out.result = result_.value_or("*");
  out.status = status_;
  out.date = DateOnly(created_at_, '-');
  if (format == ExportFormat::kFen) {
    out.content = fen_;
    return out;
  }
  chess::PgnTags tags = {{"Event", "Arbiter Match"},
                         {"Site", "arbiter"},
                         {"Date", DateOnly(created_at_, '.')},
                         {"Round", "1"},
                         {"White", white_player_id_},
                         {"Black", black_player_id_},
                         {"Result", out.result}};
  out.content = chess::WritePgn(tags, move_log_, out.result);
  return out;
}

Match Match::FromPgn(const std::string& pgn, const ImportOverrides& overrides, std::vector<std::string>* warnings) {
  chess::PgnGame game;
  try {
    game = chess::ParsePgn(pgn);
  } catch (const chess::PgnError& ex) {
    throw InvalidArgumentError("invalid_pgn", std::string("PGN 형식이 올바르지 않습니다: ") + ex.what());
  }

  if (const auto* setup = chess::FindTag(game.tags, "FEN"); setup && *setup != chess::kStartFen) {
    throw InvalidArgumentError("unsupported_setup", "시작 국면이 표준이 아닌 PGN은 가져올 수 없습니다");
  }

  auto tag_or = [&](const char* key, const char* fallback) {
    const auto* value = chess::FindTag(game.tags, key);
    return value && !value->empty() && *value != "?" ? *value : std::string(fallback);
  };
  std::string white = overrides.white_player_id.value_or(tag_or("White", "Unknown"));
  std::string black = overrides.black_player_id.value_or(tag_or("Black", "Unknown"));

  Match match(std::move(white), std::move(black));
  for (const auto& san : game.moves) {
    try {
      match.ApplyMove(san);
    } catch (const InvalidMoveError&) {
      throw InvalidArgumentError("invalid_pgn_move", "PGN에 둘 수 없는 수가 있습니다: " + san);
    } catch (const IllegalStateError&) {
      throw InvalidArgumentError("invalid_pgn_move", "게임이 끝난 뒤에 수가 있습니다: " + san);
    }
  }

  auto warn = [&](const std::string& message) {
    if (warnings) {
      warnings->push_back(message);
    }
  };
  if (const auto* tag = chess::FindTag(game.tags, "Result"); tag && *tag != game.result) {
    warn("Result 태그(" + *tag + ")와 무브텍스트 결과(" + game.result + ")가 다릅니다");
  }

  if (match.Status() == MatchStatus::kCompleted) {
    if (game.result != "*" && game.result != *match.Result()) {
      warn("기록된 결과(" + game.result + ") 대신 실제 종국 결과(" + *match.Result() + ")를 사용합니다");
    }
  } else if (game.result != "*") {
    match.CompleteGame(game.result);
  }
  return match;
}

nlohmann::json Match::ToJson() const {
  nlohmann::json history = nlohmann::json::object();
  for (const auto& [fingerprint, count] : position_history_) {
    history[fingerprint] = count;
  }
  nlohmann::json json;
  json["id"] = id_;
  json["whitePlayerId"] = white_player_id_;
  json["blackPlayerId"] = black_player_id_;
  json["status"] = ToString(status_);
  json["fen"] = fen_;
  json["pgn"] = NotationLog();
  json["turn"] = ColorName(Turn());
  json["result"] = OptionalToJson(result_);
  json["drawDetails"] = draw_details_ ? DrawDetailsToJson(*draw_details_) : nlohmann::json(nullptr);
  json["positionHistory"] = history;
  json["drawOfferFrom"] = OptionalToJson(draw_offer_from_);
  json["pauseRequestedBy"] = OptionalToJson(pause_requested_by_);
  json["createdAt"] = FormatTimestamp(created_at_);
  json["updatedAt"] = FormatTimestamp(updated_at_);
  json["lastMoveAt"] = last_move_at_ ? nlohmann::json(FormatTimestamp(*last_move_at_)) : nlohmann::json(nullptr);
  json["timeControl"] = time_control_ ? TimeControlToJson(*time_control_) : nlohmann::json(nullptr);
  json["whiteTimeRemaining"] = OptionalToJson(white_time_remaining_);
  json["blackTimeRemaining"] = OptionalToJson(black_time_remaining_);
  json["moveHistory"] = move_log_;
  return json;
}

Match Match::FromJson(const nlohmann::json& json) {
  if (!json.is_object()) {
    throw CorruptStateError("invalid_record", "저장된 매치가 JSON 객체가 아닙니다");
  }
  try {
    Match match;
    match.id_ = StringField(json, "id");
    match.white_player_id_ = StringField(json, "whitePlayerId");
    match.black_player_id_ = StringField(json, "blackPlayerId");
    auto status = ParseMatchStatus(StringField(json, "status"));
    if (!status) {
      throw CorruptStateError("invalid_field", "알 수 없는 매치 상태입니다");
    }
    match.status_ = *status;

    const auto& moves = Field(json, "moveHistory");
    if (!moves.is_array()) {
      throw CorruptStateError("invalid_field", "moveHistory는 배열이어야 합니다");
    }
    for (const auto& move : moves) {
      if (!move.is_string()) {
        throw CorruptStateError("invalid_field", "moveHistory 항목은 문자열이어야 합니다");
      }
      match.move_log_.push_back(move.get<std::string>());
    }
    chess::Board replayed;
    std::map<std::string, int> replayed_history{{Fingerprint(replayed.Fen()), 1}};
    Replay(match.move_log_, [&](std::size_t, const chess::Move&, const chess::Board& board) {
      replayed = board;
      ++replayed_history[Fingerprint(board.Fen())];
    });
    const std::string stored_fen = StringField(json, "fen");
    if (replayed.Fen() != stored_fen) {
      throw CorruptStateError("position_mismatch", "재생한 국면이 저장된 FEN과 다릅니다: " + stored_fen);
    }
    match.board_ = replayed;
    match.fen_ = replayed.Fen();

    const auto& history = Field(json, "positionHistory");
    if (!history.is_object()) {
      throw CorruptStateError("invalid_field", "positionHistory는 객체여야 합니다");
    }
    for (auto it = history.begin(); it != history.end(); ++it) {
      if (!it.value().is_number_integer() || it.value().get<int>() < 1) {
        throw CorruptStateError("invalid_field", "positionHistory 값은 1 이상의 정수여야 합니다");
      }
      match.position_history_[it.key()] = it.value().get<int>();
    }
    if (match.position_history_.count(Fingerprint(chess::kStartFen)) == 0) {
      throw CorruptStateError("invalid_field", "positionHistory에 시작 국면이 없습니다");
    }
    if (match.position_history_ != replayed_history) {
      throw CorruptStateError("position_mismatch", "positionHistory가 재생한 수순과 다릅니다");
    }

    match.result_ = OptionalString(json, "result");
    if (match.result_ && !IsFinalResult(*match.result_)) {
      throw CorruptStateError("invalid_field", "결과 토큰이 올바르지 않습니다: " + *match.result_);
    }
    if ((match.status_ == MatchStatus::kCompleted) != match.result_.has_value()) {
      throw CorruptStateError("status_mismatch", "종료 상태와 결과 유무가 일치하지 않습니다");
    }
    if (match.status_ != MatchStatus::kCompleted && replayed.IsGameOver()) {
      throw CorruptStateError("status_mismatch", "종국 국면인데 매치가 종료되지 않았습니다");
    }

    auto draw_it = json.find("drawDetails");
    if (draw_it != json.end() && !draw_it->is_null()) {
      if (!draw_it->is_object()) {
        throw CorruptStateError("invalid_field", "drawDetails는 객체여야 합니다");
      }
      auto type = ParseDrawType(StringField(*draw_it, "type"));
      if (!type) {
        throw CorruptStateError("invalid_field", "알 수 없는 무승부 유형입니다");
      }
      DrawDetails details;
      details.type = *type;
      details.description = StringField(*draw_it, "description");
      if (auto clock = OptionalInteger(*draw_it, "halfmoveClock")) {
        details.halfmove_clock = static_cast<int>(*clock);
      }
      if (auto count = OptionalInteger(*draw_it, "repetitionCount")) {
        details.repetition_count = static_cast<int>(*count);
      }
      match.draw_details_ = std::move(details);
    }

    match.draw_offer_from_ = OptionalString(json, "drawOfferFrom");
    match.pause_requested_by_ = OptionalString(json, "pauseRequestedBy");
    if (match.draw_offer_from_ && match.status_ != MatchStatus::kActive) {
      throw CorruptStateError("status_mismatch", "진행 중이 아닌 매치에 무승부 제안이 있습니다");
    }
    if (match.pause_requested_by_.has_value() != (match.status_ == MatchStatus::kPaused)) {
      throw CorruptStateError("status_mismatch", "일시정지 요청자와 상태가 일치하지 않습니다");
    }

    match.created_at_ = TimestampField(json, "createdAt");
    match.updated_at_ = TimestampField(json, "updatedAt");
    match.last_move_at_ = OptionalTimestamp(json, "lastMoveAt");

    auto tc_it = json.find("timeControl");
    if (tc_it != json.end() && !tc_it->is_null()) {
      if (!tc_it->is_object()) {
        throw CorruptStateError("invalid_field", "timeControl은 객체여야 합니다");
      }
      auto type = ParseTimeControlType(StringField(*tc_it, "type"));
      if (!type) {
        throw CorruptStateError("invalid_field", "알 수 없는 시간 제어 유형입니다");
      }
      match.time_control_ = TimeControl{*type, OptionalInteger(*tc_it, "initialTime"),
                                        OptionalInteger(*tc_it, "increment")};
    }
    match.white_time_remaining_ = OptionalInteger(json, "whiteTimeRemaining");
    match.black_time_remaining_ = OptionalInteger(json, "blackTimeRemaining");
    return match;
  } catch (const nlohmann::json::exception& ex) {
    throw CorruptStateError("invalid_record", std::string("저장된 매치를 해석할 수 없습니다: ") + ex.what());
  }
}

}  // namespace arbiter
