/*
 * 설명: 이름 있는 도구 목록(파라미터 스키마 포함)을 노출하고, 파라미터 검증 후 세션 관리자로 디스패치하며,
 *       예외를 단일 엔벨로프로 변환한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/tool_service_test.cpp, server/tests/e2e/tool_flow_test.cpp
 */
#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "arbiter/observability.hpp"
#include "arbiter/session_manager.hpp"

namespace arbiter {

enum class ParamType { kString, kNumber, kBoolean, kObject };

struct ToolParam {
  std::string name;
  ParamType type{ParamType::kString};
  std::string description;
  bool required{false};
  std::vector<std::string> enum_values;
};

struct ToolSpec {
  std::string name;
  std::string description;
  std::vector<ToolParam> params;
};

struct ToolResponse {
  bool success{false};
  std::string error_code;  // 성공이면 비어 있다.
  nlohmann::json envelope;
};

nlohmann::json MatchSummary(const Match& match);

class ToolService {
 public:
  ToolService(std::shared_ptr<SessionManager> manager, std::shared_ptr<Observability> observability);

  const std::vector<ToolSpec>& Tools() const { return specs_; }
  // JSON Schema 형태의 도구 목록.
  nlohmann::json Catalog() const;
  ToolResponse Execute(const std::string& name, const nlohmann::json& params);

 private:
  using Handler = std::function<nlohmann::json(const nlohmann::json&)>;

  void Register(ToolSpec spec, Handler handler);
  void RegisterTools();

  nlohmann::json CreateGame(const nlohmann::json& params);
  nlohmann::json GetGameStatus(const nlohmann::json& params);
  nlohmann::json MakeMove(const nlohmann::json& params);
  nlohmann::json ListGames(const nlohmann::json& params);
  nlohmann::json ResignGame(const nlohmann::json& params);
  nlohmann::json OfferDraw(const nlohmann::json& params);
  nlohmann::json AcceptDraw(const nlohmann::json& params);
  nlohmann::json DeclineDraw(const nlohmann::json& params);
  nlohmann::json GetLegalMoves(const nlohmann::json& params);
  nlohmann::json GetBoardState(const nlohmann::json& params);
  nlohmann::json ValidateMove(const nlohmann::json& params);
  nlohmann::json GetMoveHistory(const nlohmann::json& params);
  nlohmann::json ExportGame(const nlohmann::json& params);
  nlohmann::json ImportGame(const nlohmann::json& params);
  nlohmann::json PauseGame(const nlohmann::json& params);
  nlohmann::json ResumeGame(const nlohmann::json& params);
  nlohmann::json GetDrawStatus(const nlohmann::json& params);
  nlohmann::json DeleteGame(const nlohmann::json& params);

  std::shared_ptr<SessionManager> manager_;
  std::shared_ptr<Observability> observability_;
  std::vector<ToolSpec> specs_;
  std::unordered_map<std::string, Handler> handlers_;
};

}  // namespace arbiter
