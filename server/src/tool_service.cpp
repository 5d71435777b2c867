/*
 * 설명: 도구 스키마 등록, 파라미터 검증, 디스패치, 예외-엔벨로프 변환을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/tool_service_test.cpp, server/tests/e2e/tool_flow_test.cpp
 */
#include "arbiter/tool_service.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>

#include "arbiter/api_response.hpp"
#include "arbiter/db_client.hpp"

namespace arbiter {
namespace {
class ToolParamError : public std::runtime_error {
 public:
  ToolParamError(std::string parameter, const std::string& message)
      : std::runtime_error(message), parameter(std::move(parameter)) {}
  std::string parameter;
};

std::string_view TypeName(ParamType type) {
  switch (type) {
    case ParamType::kString:
      return "string";
    case ParamType::kNumber:
      return "number";
    case ParamType::kBoolean:
      return "boolean";
    case ParamType::kObject:
      return "object";
  }
  return "string";
}

bool MatchesType(const nlohmann::json& value, ParamType type) {
  switch (type) {
    case ParamType::kString:
      return value.is_string();
    case ParamType::kNumber:
      return value.is_number();
    case ParamType::kBoolean:
      return value.is_boolean();
    case ParamType::kObject:
      return value.is_object();
  }
  return false;
}

void ValidateParams(const ToolSpec& spec, const nlohmann::json& params) {
  for (const auto& param : spec.params) {
    auto it = params.find(param.name);
    if (it == params.end() || it->is_null()) {
      if (param.required) {
        throw ToolParamError(param.name, "필수 파라미터가 없습니다: " + param.name);
      }
      continue;
    }
    if (!MatchesType(*it, param.type)) {
      throw ToolParamError(param.name, "파라미터 타입이 올바르지 않습니다: " + param.name + " (기대: " +
                                           std::string(TypeName(param.type)) + ", 실제: " + it->type_name() + ")");
    }
    if (!param.enum_values.empty()) {
      const auto value = it->get<std::string>();
      if (std::find(param.enum_values.begin(), param.enum_values.end(), value) == param.enum_values.end()) {
        throw ToolParamError(param.name, "허용되지 않는 값입니다: " + param.name + "=" + value);
      }
    }
  }
}

std::string Str(const nlohmann::json& params, const char* key) { return params.at(key).get<std::string>(); }

std::optional<std::string> OptStr(const nlohmann::json& params, const char* key) {
  auto it = params.find(key);
  if (it == params.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

ToolParam Required(std::string name, std::string description) {
  return ToolParam{std::move(name), ParamType::kString, std::move(description), true, {}};
}

ToolParam Optional(std::string name, ParamType type, std::string description,
                   std::vector<std::string> enum_values = {}) {
  return ToolParam{std::move(name), type, std::move(description), false, std::move(enum_values)};
}

nlohmann::json DrawStatusToJson(const std::optional<DrawStatus>& status) {
  if (!status) {
    return nullptr;
  }
  return {{"halfmoveClock", status->halfmove_clock},
          {"movesUntilFiftyMove", status->moves_until_fifty_move},
          {"repetitionCount", status->repetition_count},
          {"isApproachingFiftyMove", status->is_approaching_fifty_move},
          {"isApproachingRepetition", status->is_approaching_repetition}};
}

nlohmann::json HistoryToJson(const AlgebraicHistory& history) { return history.moves; }

nlohmann::json HistoryToJson(const UciHistory& history) { return history.moves; }

nlohmann::json HistoryToJson(const VerboseHistory& history) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& entry : history.entries) {
    out.push_back({{"moveNumber", entry.move_number},
                   {"player", entry.player},
                   {"move", entry.move},
                   {"timestamp", entry.timestamp ? nlohmann::json(FormatTimestamp(*entry.timestamp))
                                                 : nlohmann::json(nullptr)}});
  }
  return out;
}

nlohmann::json HistoryToJson(const WithFenHistory& history) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& entry : history.entries) {
    out.push_back({{"moveNumber", entry.move_number}, {"move", entry.move}, {"fen", entry.fen}});
  }
  return out;
}

nlohmann::json HistoryToJson(const DetailedHistory& history) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& entry : history.entries) {
    out.push_back({{"moveNumber", entry.move_number},
                   {"move", entry.move},
                   {"fen", entry.fen},
                   {"check", entry.check},
                   {"capture", entry.capture},
                   {"castling", entry.castling}});
  }
  return out;
}

TimeControl ParseTimeControlParam(const nlohmann::json& value) {
  TimeControl tc;
  auto type_it = value.find("type");
  if (type_it == value.end() || !type_it->is_string()) {
    throw InvalidArgumentError("invalid_time_control", "timeControl.type이 필요합니다");
  }
  auto type = ParseTimeControlType(type_it->get<std::string>());
  if (!type) {
    throw InvalidArgumentError("invalid_time_control", "timeControl.type은 unlimited, fixed, fischer 중 하나입니다");
  }
  tc.type = *type;
  for (const char* key : {"initialTime", "increment"}) {
    auto it = value.find(key);
    if (it == value.end() || it->is_null()) {
      continue;
    }
    if (!it->is_number_integer()) {
      throw InvalidArgumentError("invalid_time_control", std::string("timeControl.") + key + "는 정수여야 합니다");
    }
    (std::string(key) == "initialTime" ? tc.initial_time : tc.increment) = it->get<long>();
  }
  return tc;
}
}  // namespace

nlohmann::json MatchSummary(const Match& match) {
  nlohmann::json summary = match.ToJson();
  summary["gameId"] = match.Id();
  summary["currentTurn"] = summary["turn"];
  summary["currentPlayerId"] = match.TurnPlayerId();
  summary["inCheck"] = match.InCheck();
  summary.erase("id");
  summary.erase("turn");
  summary.erase("positionHistory");
  return summary;
}

ToolService::ToolService(std::shared_ptr<SessionManager> manager, std::shared_ptr<Observability> observability)
    : manager_(std::move(manager)), observability_(std::move(observability)) {
  RegisterTools();
}

void ToolService::Register(ToolSpec spec, Handler handler) {
  handlers_.emplace(spec.name, std::move(handler));
  specs_.push_back(std::move(spec));
}

void ToolService::RegisterTools() {
  using namespace std::placeholders;
  const ToolParam game_id = Required("gameId", "매치 ID");
  const ToolParam player_id = Required("playerId", "요청한 참가자 ID");

  Register({"create_game", "두 참가자 사이의 새 매치를 만든다",
            {Required("whitePlayerId", "백 참가자 ID"), Required("blackPlayerId", "흑 참가자 ID"),
             Optional("timeControl", ParamType::kObject, "시간 제어 {type, initialTime, increment} (초)")}},
           std::bind(&ToolService::CreateGame, this, _1));
  Register({"get_game_status", "매치의 현재 상태를 조회한다", {game_id}},
           std::bind(&ToolService::GetGameStatus, this, _1));
  Register({"make_move", "자신의 차례에 수를 둔다",
            {game_id, Required("move", "SAN(Nf3) 또는 좌표(e2e4) 표기"), player_id}},
           std::bind(&ToolService::MakeMove, this, _1));
  Register({"list_games", "상태/참가자 조건으로 매치 목록을 조회한다",
            {Optional("status", ParamType::kString, "매치 상태", {"active", "paused", "completed"}),
             Optional("playerId", ParamType::kString, "참가자 ID")}},
           std::bind(&ToolService::ListGames, this, _1));
  Register({"resign_game", "기권한다", {game_id, player_id}}, std::bind(&ToolService::ResignGame, this, _1));
  Register({"offer_draw", "무승부를 제안한다", {game_id, player_id}}, std::bind(&ToolService::OfferDraw, this, _1));
  Register({"accept_draw", "상대의 무승부 제안을 수락한다", {game_id, player_id}},
           std::bind(&ToolService::AcceptDraw, this, _1));
  Register({"decline_draw", "무승부 제안을 거절한다", {game_id, player_id}},
           std::bind(&ToolService::DeclineDraw, this, _1));
  Register({"get_legal_moves", "현재 국면의 합법 수를 조회한다",
            {game_id, Optional("square", ParamType::kString, "출발 칸(e2)으로 한정")}},
           std::bind(&ToolService::GetLegalMoves, this, _1));
  Register({"get_board_state", "보드 상태를 조회한다",
            {game_id, Optional("format", ParamType::kString, "표현 형식", {"visual", "FEN", "PGN"})}},
           std::bind(&ToolService::GetBoardState, this, _1));
  Register({"validate_move", "수를 두지 않고 합법 여부만 확인한다", {game_id, Required("move", "검증할 수")}},
           std::bind(&ToolService::ValidateMove, this, _1));
  Register({"get_move_history", "수 기록을 조회한다",
            {game_id, Optional("format", ParamType::kString, "기록 형식",
                               {"algebraic", "UCI", "uci", "verbose", "with_fen", "detailed"})}},
           std::bind(&ToolService::GetMoveHistory, this, _1));
  Register({"export_game", "매치를 PGN 또는 FEN으로 내보낸다",
            {game_id, Optional("format", ParamType::kString, "내보내기 형식", {"PGN", "FEN"})}},
           std::bind(&ToolService::ExportGame, this, _1));
  Register({"import_game", "PGN에서 매치를 가져온다",
            {Required("pgn", "가져올 PGN"),
             Optional("metadata", ParamType::kObject, "참가자 ID 덮어쓰기 {whitePlayerId, blackPlayerId}")}},
           std::bind(&ToolService::ImportGame, this, _1));
  Register({"pause_game", "진행 중인 매치를 일시정지한다", {game_id, player_id}},
           std::bind(&ToolService::PauseGame, this, _1));
  Register({"resume_game", "일시정지된 매치를 재개한다", {game_id}}, std::bind(&ToolService::ResumeGame, this, _1));
  Register({"get_draw_status", "50수/반복 무승부 진행 상황을 조회한다", {game_id}},
           std::bind(&ToolService::GetDrawStatus, this, _1));
  Register({"delete_game", "매치를 삭제한다", {game_id}}, std::bind(&ToolService::DeleteGame, this, _1));
}

nlohmann::json ToolService::Catalog() const {
  nlohmann::json tools = nlohmann::json::array();
  for (const auto& spec : specs_) {
    nlohmann::json properties = nlohmann::json::object();
    nlohmann::json required = nlohmann::json::array();
    for (const auto& param : spec.params) {
      nlohmann::json property{{"type", TypeName(param.type)}, {"description", param.description}};
      if (!param.enum_values.empty()) {
        property["enum"] = param.enum_values;
      }
      properties[param.name] = property;
      if (param.required) {
        required.push_back(param.name);
      }
    }
    tools.push_back({{"name", spec.name},
                     {"description", spec.description},
                     {"inputSchema", {{"type", "object"}, {"properties", properties}, {"required", required}}}});
  }
  return tools;
}

ToolResponse ToolService::Execute(const std::string& name, const nlohmann::json& params) {
  auto started = std::chrono::steady_clock::now();
  ToolResponse response;
  std::string message;

  auto fail = [&](std::string_view code, const std::string& msg, const nlohmann::json& detail) {
    response.success = false;
    response.error_code = std::string(code);
    response.envelope = MakeErrorEnvelope(code, msg, detail);
    message = msg;
  };

  const nlohmann::json args = params.is_null() ? nlohmann::json::object() : params;
  auto spec = std::find_if(specs_.begin(), specs_.end(), [&](const ToolSpec& s) { return s.name == name; });
  if (spec == specs_.end()) {
    fail("unknown_tool", "알 수 없는 도구입니다: " + name, {{"tool", name}});
  } else if (!args.is_object()) {
    fail("bad_request", "파라미터는 JSON 객체여야 합니다", nullptr);
  } else {
    try {
      ValidateParams(*spec, args);
      nlohmann::json data = handlers_.at(name)(args);
      response.success = true;
      response.envelope = MakeSuccessEnvelope(data);
    } catch (const ToolParamError& ex) {
      fail("bad_request", ex.what(), {{"parameter", ex.parameter}});
    } catch (const InvalidMoveError& ex) {
      nlohmann::json detail{{"reason", ex.code}};
      detail["suggestion"] = ex.suggestion ? nlohmann::json(*ex.suggestion) : nlohmann::json(nullptr);
      if (auto move = args.find("move"); move != args.end()) {
        detail["move"] = *move;
      }
      fail(ErrorKindCode(ex.kind), ex.what(), detail);
    } catch (const MatchError& ex) {
      fail(ErrorKindCode(ex.kind), ex.what(), {{"reason", ex.code}});
    } catch (const DbException& ex) {
      fail("storage_error", ex.what(), {{"dbCode", ex.code}, {"retryable", ex.retryable}});
    } catch (const std::exception& ex) {
      fail("internal_error", ex.what(), nullptr);
    }
  }

  if (observability_) {
    LogContext ctx;
    ctx.trace_id = observability_->NextTraceId();
    ctx.name = "tool." + name;
    ctx.latency_ms = static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count());
    ctx.level = response.success ? LogLevel::kInfo : LogLevel::kWarn;
    if (args.is_object()) {
      if (auto id = args.find("gameId"); id != args.end() && id->is_string()) {
        ctx.match_id = id->get<std::string>();
      }
    }
    if (!response.success) {
      ctx.error_code = response.error_code;
      ctx.message = message;
    }
    observability_->Log(ctx);
  }
  return response;
}

nlohmann::json ToolService::CreateGame(const nlohmann::json& params) {
  std::optional<TimeControl> time_control;
  if (auto tc = params.find("timeControl"); tc != params.end() && !tc->is_null()) {
    time_control = ParseTimeControlParam(*tc);
  }
  Match match = manager_->Create(Str(params, "whitePlayerId"), Str(params, "blackPlayerId"), time_control);
  return MatchSummary(match);
}

nlohmann::json ToolService::GetGameStatus(const nlohmann::json& params) {
  const std::string id = Str(params, "gameId");
  auto match = manager_->Get(id);
  if (!match) {
    throw NotFoundError(id);
  }
  nlohmann::json summary = MatchSummary(*match);
  summary["drawStatus"] = DrawStatusToJson(match->GetDrawStatus());
  return summary;
}

nlohmann::json ToolService::MakeMove(const nlohmann::json& params) {
  const std::string id = Str(params, "gameId");
  auto outcome = manager_->ApplyMove(id, Str(params, "move"), Str(params, "playerId"));
  const Match& match = outcome.match;
  nlohmann::json data;
  data["gameId"] = match.Id();
  data["move"] = outcome.san;
  data["currentTurn"] = match.Turn() == chess::Color::kWhite ? "white" : "black";
  data["status"] = ToString(match.Status());
  data["moveHistory"] = match.MoveLog();
  data["fen"] = match.Fen();
  data["inCheck"] = match.InCheck();
  data["result"] = match.Result() ? nlohmann::json(*match.Result()) : nlohmann::json(nullptr);
  data["drawDetails"] = MatchSummary(match)["drawDetails"];
  return data;
}

nlohmann::json ToolService::ListGames(const nlohmann::json& params) {
  auto status_text = OptStr(params, "status");
  auto player = OptStr(params, "playerId");
  std::optional<MatchStatus> status;
  if (status_text) {
    status = ParseMatchStatus(*status_text);
  }

  std::vector<Match> matches;
  if (player) {
    matches = manager_->ListByParticipant(*player);
    if (status) {
      matches.erase(std::remove_if(matches.begin(), matches.end(),
                                   [&](const Match& m) { return m.Status() != *status; }),
                    matches.end());
    }
  } else if (status) {
    matches = manager_->ListByStatus(*status);
  } else {
    matches = manager_->ListAll();
  }

  nlohmann::json games = nlohmann::json::array();
  for (const auto& match : matches) {
    games.push_back(MatchSummary(match));
  }
  return {{"games", games}, {"count", matches.size()}};
}

nlohmann::json ToolService::ResignGame(const nlohmann::json& params) {
  const std::string player = Str(params, "playerId");
  Match match = manager_->Resign(Str(params, "gameId"), player);
  return {{"gameId", match.Id()}, {"status", ToString(match.Status())}, {"result", *match.Result()},
          {"resignedBy", player}};
}

nlohmann::json ToolService::OfferDraw(const nlohmann::json& params) {
  Match match = manager_->OfferDraw(Str(params, "gameId"), Str(params, "playerId"));
  return {{"gameId", match.Id()}, {"status", ToString(match.Status())}, {"drawOfferFrom", *match.DrawOfferFrom()}};
}

nlohmann::json ToolService::AcceptDraw(const nlohmann::json& params) {
  Match match = manager_->AcceptDraw(Str(params, "gameId"), Str(params, "playerId"));
  return {{"gameId", match.Id()},
          {"status", ToString(match.Status())},
          {"result", *match.Result()},
          {"drawDetails", MatchSummary(match)["drawDetails"]}};
}

nlohmann::json ToolService::DeclineDraw(const nlohmann::json& params) {
  Match match = manager_->DeclineDraw(Str(params, "gameId"), Str(params, "playerId"));
  return {{"gameId", match.Id()}, {"status", ToString(match.Status())}, {"drawOfferFrom", nullptr}};
}

nlohmann::json ToolService::GetLegalMoves(const nlohmann::json& params) {
  const std::string id = Str(params, "gameId");
  auto square = OptStr(params, "square");
  auto moves = manager_->LegalMoves(id, square);
  nlohmann::json data{{"gameId", id}, {"moves", moves}, {"count", moves.size()}};
  data["square"] = square ? nlohmann::json(*square) : nlohmann::json(nullptr);
  return data;
}

nlohmann::json ToolService::GetBoardState(const nlohmann::json& params) {
  const std::string id = Str(params, "gameId");
  const std::string format = OptStr(params, "format").value_or("visual");
  auto match = manager_->Get(id);
  if (!match) {
    throw NotFoundError(id);
  }
  std::string board;
  if (format == "FEN") {
    board = match->Fen();
  } else if (format == "PGN") {
    board = match->Export(ExportFormat::kPgn).content;
  } else {
    board = match->AsciiBoard();
  }
  return {{"gameId", id},
          {"format", format},
          {"board", board},
          {"currentTurn", match->Turn() == chess::Color::kWhite ? "white" : "black"},
          {"inCheck", match->InCheck()},
          {"status", ToString(match->Status())}};
}

nlohmann::json ToolService::ValidateMove(const nlohmann::json& params) {
  const std::string id = Str(params, "gameId");
  auto validation = manager_->ValidateMove(id, Str(params, "move"));
  nlohmann::json data{{"gameId", id}, {"valid", validation.valid}};
  data["reason"] = validation.reason ? nlohmann::json(*validation.reason) : nlohmann::json(nullptr);
  data["suggestion"] = validation.suggestion ? nlohmann::json(*validation.suggestion) : nlohmann::json(nullptr);
  return data;
}

nlohmann::json ToolService::GetMoveHistory(const nlohmann::json& params) {
  const std::string id = Str(params, "gameId");
  auto format = ParseHistoryFormat(OptStr(params, "format").value_or("algebraic"));
  if (!format) {
    throw InvalidArgumentError("invalid_format", "알 수 없는 기록 형식입니다");
  }
  MoveHistory history = manager_->GetMoveHistory(id, *format);
  nlohmann::json moves = std::visit([](const auto& h) { return HistoryToJson(h); }, history);
  return {{"gameId", id}, {"format", ToString(*format)}, {"moves", moves}, {"count", moves.size()}};
}

nlohmann::json ToolService::ExportGame(const nlohmann::json& params) {
  auto format = ParseExportFormat(OptStr(params, "format").value_or("PGN"));
  if (!format) {
    throw InvalidArgumentError("invalid_format", "알 수 없는 내보내기 형식입니다");
  }
  GameExport exported = manager_->Export(Str(params, "gameId"), *format);
  return {{"gameId", exported.match_id},
          {"format", ToString(exported.format)},
          {"content", exported.content},
          {"metadata",
           {{"whitePlayer", exported.white_player},
            {"blackPlayer", exported.black_player},
            {"result", exported.result},
            {"gameStatus", ToString(exported.status)},
            {"date", exported.date}}}};
}

nlohmann::json ToolService::ImportGame(const nlohmann::json& params) {
  const std::string pgn = Str(params, "pgn");
  if (pgn.find_first_not_of(" \t\r\n") == std::string::npos) {
    throw ToolParamError("pgn", "PGN이 비어 있습니다");
  }
  ImportOverrides overrides;
  if (auto metadata = params.find("metadata"); metadata != params.end() && metadata->is_object()) {
    for (const char* key : {"whitePlayerId", "blackPlayerId"}) {
      auto it = metadata->find(key);
      if (it == metadata->end() || it->is_null()) {
        continue;
      }
      if (!it->is_string()) {
        throw ToolParamError(std::string("metadata.") + key, std::string("metadata.") + key + "는 문자열이어야 합니다");
      }
      (std::string(key) == "whitePlayerId" ? overrides.white_player_id : overrides.black_player_id) =
          it->get<std::string>();
    }
  }
  auto outcome = manager_->Import(pgn, overrides);
  const Match& match = outcome.match;
  return {{"gameId", match.Id()},
          {"moves", match.MoveLog().size()},
          {"finalPosition", match.Fen()},
          {"result", match.Result().value_or("*")},
          {"status", ToString(match.Status())},
          {"whitePlayerId", match.WhitePlayerId()},
          {"blackPlayerId", match.BlackPlayerId()},
          {"validation", {{"valid", true}, {"warnings", outcome.warnings}}}};
}

nlohmann::json ToolService::PauseGame(const nlohmann::json& params) {
  Match match = manager_->Pause(Str(params, "gameId"), Str(params, "playerId"));
  return {{"gameId", match.Id()},
          {"status", ToString(match.Status())},
          {"pauseRequestedBy", *match.PauseRequestedBy()}};
}

nlohmann::json ToolService::ResumeGame(const nlohmann::json& params) {
  Match match = manager_->Resume(Str(params, "gameId"));
  return {{"gameId", match.Id()}, {"status", ToString(match.Status())}};
}

nlohmann::json ToolService::GetDrawStatus(const nlohmann::json& params) {
  const std::string id = Str(params, "gameId");
  return {{"gameId", id}, {"drawStatus", DrawStatusToJson(manager_->GetDrawStatus(id))}};
}

nlohmann::json ToolService::DeleteGame(const nlohmann::json& params) {
  const std::string id = Str(params, "gameId");
  if (!manager_->Delete(id)) {
    throw NotFoundError(id);
  }
  return {{"gameId", id}, {"deleted", true}};
}

}  // namespace arbiter
