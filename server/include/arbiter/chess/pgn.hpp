/*
 * 설명: PGN 태그/무브텍스트 파싱과 생성을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/pgn_test.cpp
 */
#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace arbiter::chess {

using PgnTags = std::vector<std::pair<std::string, std::string>>;

class PgnError : public std::runtime_error {
 public:
  explicit PgnError(const std::string& message) : std::runtime_error(message) {}
};

struct PgnGame {
  PgnTags tags;  // 입력 순서 유지
  std::vector<std::string> moves;
  std::string result{"*"};
};

PgnGame ParsePgn(const std::string& text);

// 결과 토큰을 포함한 무브텍스트를 80열 기준으로 줄바꿈한다.
std::string WriteMovetext(const std::vector<std::string>& moves, const std::string& result);
std::string WritePgn(const PgnTags& tags, const std::vector<std::string>& moves, const std::string& result);

const std::string* FindTag(const PgnTags& tags, const std::string& key);
bool IsResultToken(const std::string& token);

}  // namespace arbiter::chess
