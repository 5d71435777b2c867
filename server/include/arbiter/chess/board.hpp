/*
 * 설명: 체스 보드 상태, FEN 변환, 합법 수 생성, SAN/UCI 표기 변환을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/chess_board_test.cpp
 */
#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace arbiter::chess {

inline constexpr const char* kStartFen = "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

enum class Color { kWhite, kBlack };

enum class PieceType { kNone, kPawn, kKnight, kBishop, kRook, kQueen, kKing };

struct Piece {
  PieceType type{PieceType::kNone};
  Color color{Color::kWhite};

  bool Empty() const { return type == PieceType::kNone; }
};

// 칸 번호는 a1=0, h1=7, a8=56, h8=63.
struct Move {
  int from{0};
  int to{0};
  PieceType promotion{PieceType::kNone};
  bool capture{false};
  bool en_passant{false};
  bool castle{false};
  bool double_push{false};
};

class FenError : public std::runtime_error {
 public:
  explicit FenError(const std::string& message) : std::runtime_error(message) {}
};

Color Opposite(Color color);
std::optional<int> ParseSquare(std::string_view text);
std::string SquareName(int square);

class Board {
 public:
  Board();

  static Board FromFen(const std::string& fen);
  std::string Fen() const;

  Color SideToMove() const { return side_; }
  int HalfmoveClock() const { return halfmove_clock_; }
  int FullmoveNumber() const { return fullmove_number_; }
  Piece PieceAt(int square) const { return squares_[square]; }

  std::vector<Move> LegalMoves() const;
  std::vector<Move> LegalMovesFrom(int square) const;

  // 합법성 검증이 끝난 수만 전달해야 한다.
  void Apply(const Move& move);

  bool InCheck() const;
  bool IsCheckmate() const;
  bool IsStalemate() const;
  bool IsInsufficientMaterial() const;
  bool IsFiftyMoveDraw() const { return halfmove_clock_ >= 100; }
  bool IsGameOver() const;

  std::optional<Move> ParseMove(std::string_view text) const;
  std::string ToSan(const Move& move) const;
  static std::string ToUci(const Move& move);

  std::string Ascii() const;

 private:
  static constexpr std::uint8_t kWhiteKingSide = 1;
  static constexpr std::uint8_t kWhiteQueenSide = 2;
  static constexpr std::uint8_t kBlackKingSide = 4;
  static constexpr std::uint8_t kBlackQueenSide = 8;

  struct EmptyTag {};
  explicit Board(EmptyTag) {}

  std::vector<Move> PseudoLegalMoves() const;
  void AddPawnMoves(int from, std::vector<Move>& out) const;
  void AddStepMoves(int from, const int (*deltas)[2], std::size_t count, std::vector<Move>& out) const;
  void AddSlideMoves(int from, const int (*deltas)[2], std::size_t count, std::vector<Move>& out) const;
  void AddCastleMoves(std::vector<Move>& out) const;
  bool IsSquareAttacked(int square, Color by) const;
  int KingSquare(Color color) const;
  bool LeavesKingSafe(const Move& move) const;
  bool HasLegalEnPassant() const;
  std::string SanAmong(const Move& move, const std::vector<Move>& legals) const;

  std::array<Piece, 64> squares_{};
  Color side_{Color::kWhite};
  std::uint8_t castling_{0};
  int en_passant_{-1};
  int halfmove_clock_{0};
  int fullmove_number_{1};
};

}  // namespace arbiter::chess
