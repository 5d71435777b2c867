/*
 * 설명: JSON 응답 엔벨로프를 생성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "arbiter/api_response.hpp"

#include "arbiter/match_types.hpp"

namespace arbiter {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", FormatTimestamp(NowMillis())}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message) {
  return MakeErrorEnvelope(code, message, nullptr);
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message, const nlohmann::json& detail) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", detail}};
  envelope["meta"] = {{"timestamp", FormatTimestamp(NowMillis())}};
  return envelope;
}

}  // namespace arbiter
