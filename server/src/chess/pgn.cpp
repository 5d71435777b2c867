/*
 * 설명: PGN 파서(태그, 주석, 변화수, NAG, 결과 토큰)와 생성기를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/pgn_test.cpp
 */
#include "arbiter/chess/pgn.hpp"

#include <cctype>
#include <sstream>

namespace arbiter::chess {
namespace {
constexpr std::size_t kLineWidth = 80;

std::string StripCommentsAndVariations(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  int brace = 0;
  int paren = 0;
  bool line_comment = false;
  for (char c : text) {
    if (line_comment) {
      if (c == '\n' || c == '\r') {
        line_comment = false;
        out.push_back(' ');
      }
      continue;
    }
    if (brace > 0) {
      if (c == '}') {
        --brace;
        out.push_back(' ');
      }
      continue;
    }
    if (paren > 0) {
      if (c == '(') {
        ++paren;
      } else if (c == ')') {
        --paren;
        if (paren == 0) {
          out.push_back(' ');
        }
      }
      continue;
    }
    if (c == ';') {
      line_comment = true;
    } else if (c == '{') {
      brace = 1;
    } else if (c == '(') {
      paren = 1;
    } else if (c == ')' || c == '}') {
      throw PgnError("PGN 괄호 짝이 맞지 않습니다");
    } else {
      out.push_back(c);
    }
  }
  if (brace > 0) {
    throw PgnError("PGN 주석이 닫히지 않았습니다");
  }
  if (paren > 0) {
    throw PgnError("PGN 변화수가 닫히지 않았습니다");
  }
  return out;
}

bool IsMoveNumber(const std::string& token) {
  std::size_t i = 0;
  while (i < token.size() && std::isdigit(static_cast<unsigned char>(token[i]))) {
    ++i;
  }
  if (i == 0) {
    return false;
  }
  std::size_t j = i;
  while (j < token.size() && token[j] == '.') {
    ++j;
  }
  return j > i && j == token.size();
}

// "1.e4", "10...O-O" 처럼 번호와 수가 붙은 토큰을 분리한다.
void PushToken(std::vector<std::string>& tokens, const std::string& token) {
  if (token.empty()) {
    return;
  }
  std::size_t i = 0;
  while (i < token.size() && std::isdigit(static_cast<unsigned char>(token[i]))) {
    ++i;
  }
  std::size_t j = i;
  while (j < token.size() && token[j] == '.') {
    ++j;
  }
  if (i > 0 && j > i && j < token.size()) {
    tokens.push_back(token.substr(0, j));
    tokens.push_back(token.substr(j));
    return;
  }
  tokens.push_back(token);
}

std::vector<std::string> Tokenize(const std::string& movetext) {
  std::vector<std::string> tokens;
  std::string current;
  for (std::size_t i = 0; i < movetext.size(); ++i) {
    const unsigned char c = static_cast<unsigned char>(movetext[i]);
    if (std::isspace(c)) {
      PushToken(tokens, current);
      current.clear();
      continue;
    }
    if (c == '$') {
      PushToken(tokens, current);
      current.clear();
      while (i + 1 < movetext.size() && std::isdigit(static_cast<unsigned char>(movetext[i + 1]))) {
        ++i;
      }
      continue;
    }
    current.push_back(static_cast<char>(c));
  }
  PushToken(tokens, current);
  return tokens;
}

std::size_t ParseTagLine(const std::string& text, std::size_t start, PgnTags& tags) {
  std::size_t i = start + 1;
  while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) {
    ++i;
  }
  std::string key;
  while (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i])) && text[i] != '"' &&
         text[i] != ']') {
    key.push_back(text[i++]);
  }
  while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) {
    ++i;
  }
  if (key.empty() || i >= text.size() || text[i] != '"') {
    throw PgnError("PGN 태그 형식이 올바르지 않습니다");
  }
  ++i;
  std::string value;
  bool closed = false;
  while (i < text.size()) {
    char c = text[i++];
    if (c == '\\' && i < text.size()) {
      value.push_back(text[i++]);
      continue;
    }
    if (c == '"') {
      closed = true;
      break;
    }
    value.push_back(c);
  }
  while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) {
    ++i;
  }
  if (!closed || i >= text.size() || text[i] != ']') {
    throw PgnError("PGN 태그가 닫히지 않았습니다: " + key);
  }
  tags.emplace_back(std::move(key), std::move(value));
  return i + 1;
}

std::string EscapeTagValue(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (char c : value) {
    if (c == '"' || c == '\\') {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  return out;
}
}  // namespace

bool IsResultToken(const std::string& token) {
  return token == "1-0" || token == "0-1" || token == "1/2-1/2" || token == "*";
}

const std::string* FindTag(const PgnTags& tags, const std::string& key) {
  for (const auto& tag : tags) {
    if (tag.first == key) {
      return &tag.second;
    }
  }
  return nullptr;
}

PgnGame ParsePgn(const std::string& text) {
  PgnGame game;
  std::size_t i = 0;
  while (i < text.size()) {
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) {
      ++i;
    }
    if (i >= text.size() || text[i] != '[') {
      break;
    }
    i = ParseTagLine(text, i, game.tags);
  }

  bool saw_result = false;
  for (const auto& token : Tokenize(StripCommentsAndVariations(text.substr(i)))) {
    if (IsMoveNumber(token)) {
      continue;
    }
    if (IsResultToken(token)) {
      game.result = token;
      saw_result = true;
      continue;
    }
    if (saw_result) {
      throw PgnError("결과 토큰 뒤에 수가 있습니다: " + token);
    }
    game.moves.push_back(token);
  }

  if (!saw_result) {
    if (const auto* tag = FindTag(game.tags, "Result"); tag && IsResultToken(*tag)) {
      game.result = *tag;
    }
  }
  if (game.tags.empty() && game.moves.empty()) {
    throw PgnError("PGN 내용이 비어 있습니다");
  }
  return game;
}

std::string WriteMovetext(const std::vector<std::string>& moves, const std::string& result) {
  std::vector<std::string> tokens;
  tokens.reserve(moves.size() + moves.size() / 2 + 2);
  for (std::size_t ply = 0; ply < moves.size(); ++ply) {
    if (ply % 2 == 0) {
      tokens.push_back(std::to_string(ply / 2 + 1) + ".");
    }
    tokens.push_back(moves[ply]);
  }
  tokens.push_back(result.empty() ? "*" : result);

  std::string out;
  std::size_t line_length = 0;
  for (const auto& token : tokens) {
    if (line_length > 0 && line_length + 1 + token.size() > kLineWidth) {
      out.push_back('\n');
      line_length = 0;
    } else if (line_length > 0) {
      out.push_back(' ');
      ++line_length;
    }
    out += token;
    line_length += token.size();
  }
  return out;
}

std::string WritePgn(const PgnTags& tags, const std::vector<std::string>& moves, const std::string& result) {
  std::ostringstream oss;
  for (const auto& [key, value] : tags) {
    oss << '[' << key << " \"" << EscapeTagValue(value) << "\"]\n";
  }
  if (!tags.empty()) {
    oss << '\n';
  }
  oss << WriteMovetext(moves, result);
  return oss.str();
}

}  // namespace arbiter::chess
