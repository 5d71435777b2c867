/*
 * 설명: 보드 상태 갱신, 합법 수 생성, 종국 판정, SAN/UCI 변환을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/chess_board_test.cpp
 */
#include "arbiter/chess/board.hpp"

#include <cctype>
#include <sstream>

namespace arbiter::chess {
namespace {
constexpr int kKnightDeltas[8][2] = {{1, 2}, {2, 1}, {2, -1}, {1, -2}, {-1, -2}, {-2, -1}, {-2, 1}, {-1, 2}};
constexpr int kKingDeltas[8][2] = {{1, 0}, {1, 1}, {0, 1}, {-1, 1}, {-1, 0}, {-1, -1}, {0, -1}, {1, -1}};
constexpr int kBishopDirs[4][2] = {{1, 1}, {1, -1}, {-1, 1}, {-1, -1}};
constexpr int kRookDirs[4][2] = {{1, 0}, {-1, 0}, {0, 1}, {0, -1}};
constexpr PieceType kPromotionOrder[4] = {PieceType::kQueen, PieceType::kRook, PieceType::kBishop,
                                          PieceType::kKnight};

int FileOf(int square) { return square & 7; }
int RankOf(int square) { return square >> 3; }
bool OnBoard(int file, int rank) { return file >= 0 && file < 8 && rank >= 0 && rank < 8; }
int ToSquare(int file, int rank) { return rank * 8 + file; }

char PieceLetter(PieceType type) {
  switch (type) {
    case PieceType::kPawn:
      return 'p';
    case PieceType::kKnight:
      return 'n';
    case PieceType::kBishop:
      return 'b';
    case PieceType::kRook:
      return 'r';
    case PieceType::kQueen:
      return 'q';
    case PieceType::kKing:
      return 'k';
    default:
      return '.';
  }
}

char PieceChar(const Piece& piece) {
  char c = PieceLetter(piece.type);
  if (piece.Empty()) {
    return c;
  }
  return piece.color == Color::kWhite ? static_cast<char>(std::toupper(static_cast<unsigned char>(c))) : c;
}

std::optional<PieceType> PieceFromLetter(char c) {
  switch (std::tolower(static_cast<unsigned char>(c))) {
    case 'p':
      return PieceType::kPawn;
    case 'n':
      return PieceType::kKnight;
    case 'b':
      return PieceType::kBishop;
    case 'r':
      return PieceType::kRook;
    case 'q':
      return PieceType::kQueen;
    case 'k':
      return PieceType::kKing;
    default:
      return std::nullopt;
  }
}

std::vector<std::string> SplitFields(const std::string& text) {
  std::vector<std::string> fields;
  std::istringstream iss(text);
  std::string field;
  while (iss >> field) {
    fields.push_back(field);
  }
  return fields;
}

int ParseCounter(const std::string& text, const char* field_name) {
  if (text.empty() || text.size() > 6) {
    throw FenError(std::string("FEN ") + field_name + " 필드가 올바르지 않습니다");
  }
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      throw FenError(std::string("FEN ") + field_name + " 필드가 올바르지 않습니다");
    }
  }
  return std::stoi(text);
}

std::string Trim(std::string_view text) {
  std::size_t begin = 0;
  std::size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
    --end;
  }
  return std::string(text.substr(begin, end - begin));
}

// 비교용 표기: 체크/주석 기호와 승격 '='를 제거한다.
std::string NormalizeSan(std::string_view text) {
  std::string san = Trim(text);
  if (san == "0-0") {
    san = "O-O";
  } else if (san == "0-0-0") {
    san = "O-O-O";
  }
  while (!san.empty()) {
    char c = san.back();
    if (c == '+' || c == '#' || c == '!' || c == '?') {
      san.pop_back();
    } else {
      break;
    }
  }
  std::string out;
  out.reserve(san.size());
  for (char c : san) {
    if (c != '=') {
      out.push_back(c);
    }
  }
  return out;
}

bool IsUciLike(std::string_view text) {
  if (text.size() != 4 && text.size() != 5) {
    return false;
  }
  auto in = [](char c, char lo, char hi) { return c >= lo && c <= hi; };
  if (!in(text[0], 'a', 'h') || !in(text[1], '1', '8') || !in(text[2], 'a', 'h') || !in(text[3], '1', '8')) {
    return false;
  }
  if (text.size() == 5) {
    auto promo = PieceFromLetter(text[4]);
    return promo && *promo != PieceType::kPawn && *promo != PieceType::kKing;
  }
  return true;
}
}  // namespace

Color Opposite(Color color) { return color == Color::kWhite ? Color::kBlack : Color::kWhite; }

std::optional<int> ParseSquare(std::string_view text) {
  if (text.size() != 2 || text[0] < 'a' || text[0] > 'h' || text[1] < '1' || text[1] > '8') {
    return std::nullopt;
  }
  return ToSquare(text[0] - 'a', text[1] - '1');
}

std::string SquareName(int square) {
  std::string name;
  name.push_back(static_cast<char>('a' + FileOf(square)));
  name.push_back(static_cast<char>('1' + RankOf(square)));
  return name;
}

Board::Board() : Board(FromFen(kStartFen)) {}

Board Board::FromFen(const std::string& fen) {
  auto fields = SplitFields(fen);
  if (fields.size() != 6 && fields.size() != 4) {
    throw FenError("FEN 필드 수가 올바르지 않습니다: " + fen);
  }

  Board board{EmptyTag{}};
  int rank = 7;
  int file = 0;
  int white_kings = 0;
  int black_kings = 0;
  for (char c : fields[0]) {
    if (c == '/') {
      if (file != 8) {
        throw FenError("FEN 랭크 길이가 올바르지 않습니다: " + fen);
      }
      --rank;
      file = 0;
      if (rank < 0) {
        throw FenError("FEN 랭크 수가 올바르지 않습니다: " + fen);
      }
      continue;
    }
    if (c >= '1' && c <= '8') {
      file += c - '0';
      if (file > 8) {
        throw FenError("FEN 랭크 길이가 올바르지 않습니다: " + fen);
      }
      continue;
    }
    auto type = PieceFromLetter(c);
    if (!type || file >= 8) {
      throw FenError("FEN 기물 표기가 올바르지 않습니다: " + fen);
    }
    Color color = std::isupper(static_cast<unsigned char>(c)) ? Color::kWhite : Color::kBlack;
    if (*type == PieceType::kKing) {
      (color == Color::kWhite ? white_kings : black_kings)++;
    }
    board.squares_[ToSquare(file, rank)] = Piece{*type, color};
    ++file;
  }
  if (rank != 0 || file != 8) {
    throw FenError("FEN 배치 필드가 올바르지 않습니다: " + fen);
  }
  if (white_kings != 1 || black_kings != 1) {
    throw FenError("양측 킹은 정확히 하나씩이어야 합니다: " + fen);
  }

  if (fields[1] == "w") {
    board.side_ = Color::kWhite;
  } else if (fields[1] == "b") {
    board.side_ = Color::kBlack;
  } else {
    throw FenError("FEN 차례 필드가 올바르지 않습니다: " + fen);
  }

  board.castling_ = 0;
  if (fields[2] != "-") {
    for (char c : fields[2]) {
      switch (c) {
        case 'K':
          board.castling_ |= kWhiteKingSide;
          break;
        case 'Q':
          board.castling_ |= kWhiteQueenSide;
          break;
        case 'k':
          board.castling_ |= kBlackKingSide;
          break;
        case 'q':
          board.castling_ |= kBlackQueenSide;
          break;
        default:
          throw FenError("FEN 캐슬링 필드가 올바르지 않습니다: " + fen);
      }
    }
  }

  board.en_passant_ = -1;
  if (fields[3] != "-") {
    auto square = ParseSquare(fields[3]);
    int expected_rank = board.side_ == Color::kWhite ? 5 : 2;
    if (!square || RankOf(*square) != expected_rank) {
      throw FenError("FEN 앙파상 필드가 올바르지 않습니다: " + fen);
    }
    board.en_passant_ = *square;
  }

  if (fields.size() == 6) {
    board.halfmove_clock_ = ParseCounter(fields[4], "halfmove");
    board.fullmove_number_ = ParseCounter(fields[5], "fullmove");
    if (board.fullmove_number_ < 1) {
      throw FenError("FEN fullmove 필드는 1 이상이어야 합니다: " + fen);
    }
  } else {
    board.halfmove_clock_ = 0;
    board.fullmove_number_ = 1;
  }
  return board;
}

std::string Board::Fen() const {
  std::ostringstream oss;
  for (int rank = 7; rank >= 0; --rank) {
    int empty = 0;
    for (int file = 0; file < 8; ++file) {
      const Piece& piece = squares_[ToSquare(file, rank)];
      if (piece.Empty()) {
        ++empty;
        continue;
      }
      if (empty > 0) {
        oss << empty;
        empty = 0;
      }
      oss << PieceChar(piece);
    }
    if (empty > 0) {
      oss << empty;
    }
    if (rank > 0) {
      oss << '/';
    }
  }

  oss << (side_ == Color::kWhite ? " w " : " b ");

  std::string castling;
  if (castling_ & kWhiteKingSide) castling.push_back('K');
  if (castling_ & kWhiteQueenSide) castling.push_back('Q');
  if (castling_ & kBlackKingSide) castling.push_back('k');
  if (castling_ & kBlackQueenSide) castling.push_back('q');
  oss << (castling.empty() ? "-" : castling) << ' ';

  // 실제로 앙파상 포획이 가능한 경우에만 기록해야 동일 국면의 지문이 일치한다.
  oss << (HasLegalEnPassant() ? SquareName(en_passant_) : std::string("-")) << ' ';
  oss << halfmove_clock_ << ' ' << fullmove_number_;
  return oss.str();
}

std::vector<Move> Board::PseudoLegalMoves() const {
  std::vector<Move> moves;
  moves.reserve(64);
  for (int square = 0; square < 64; ++square) {
    const Piece& piece = squares_[square];
    if (piece.Empty() || piece.color != side_) {
      continue;
    }
    switch (piece.type) {
      case PieceType::kPawn:
        AddPawnMoves(square, moves);
        break;
      case PieceType::kKnight:
        AddStepMoves(square, kKnightDeltas, 8, moves);
        break;
      case PieceType::kBishop:
        AddSlideMoves(square, kBishopDirs, 4, moves);
        break;
      case PieceType::kRook:
        AddSlideMoves(square, kRookDirs, 4, moves);
        break;
      case PieceType::kQueen:
        AddSlideMoves(square, kBishopDirs, 4, moves);
        AddSlideMoves(square, kRookDirs, 4, moves);
        break;
      case PieceType::kKing:
        AddStepMoves(square, kKingDeltas, 8, moves);
        break;
      default:
        break;
    }
  }
  AddCastleMoves(moves);
  return moves;
}

void Board::AddPawnMoves(int from, std::vector<Move>& out) const {
  const int dir = side_ == Color::kWhite ? 1 : -1;
  const int start_rank = side_ == Color::kWhite ? 1 : 6;
  const int promo_rank = side_ == Color::kWhite ? 7 : 0;
  const int file = FileOf(from);
  const int rank = RankOf(from);

  auto push = [&](Move move) {
    if (RankOf(move.to) == promo_rank) {
      for (PieceType promo : kPromotionOrder) {
        move.promotion = promo;
        out.push_back(move);
      }
      return;
    }
    out.push_back(move);
  };

  const int one_rank = rank + dir;
  if (OnBoard(file, one_rank) && squares_[ToSquare(file, one_rank)].Empty()) {
    push(Move{from, ToSquare(file, one_rank)});
    const int two_rank = rank + 2 * dir;
    if (rank == start_rank && squares_[ToSquare(file, two_rank)].Empty()) {
      Move move{from, ToSquare(file, two_rank)};
      move.double_push = true;
      out.push_back(move);
    }
  }

  for (int df : {-1, 1}) {
    if (!OnBoard(file + df, one_rank)) {
      continue;
    }
    const int target = ToSquare(file + df, one_rank);
    const Piece& victim = squares_[target];
    if (!victim.Empty() && victim.color != side_) {
      Move move{from, target};
      move.capture = true;
      push(move);
    } else if (target == en_passant_) {
      Move move{from, target};
      move.capture = true;
      move.en_passant = true;
      out.push_back(move);
    }
  }
}

void Board::AddStepMoves(int from, const int (*deltas)[2], std::size_t count, std::vector<Move>& out) const {
  const int file = FileOf(from);
  const int rank = RankOf(from);
  for (std::size_t i = 0; i < count; ++i) {
    const int f = file + deltas[i][0];
    const int r = rank + deltas[i][1];
    if (!OnBoard(f, r)) {
      continue;
    }
    const int target = ToSquare(f, r);
    const Piece& occupant = squares_[target];
    if (occupant.Empty()) {
      out.push_back(Move{from, target});
    } else if (occupant.color != side_) {
      Move move{from, target};
      move.capture = true;
      out.push_back(move);
    }
  }
}

void Board::AddSlideMoves(int from, const int (*deltas)[2], std::size_t count, std::vector<Move>& out) const {
  const int file = FileOf(from);
  const int rank = RankOf(from);
  for (std::size_t i = 0; i < count; ++i) {
    int f = file + deltas[i][0];
    int r = rank + deltas[i][1];
    while (OnBoard(f, r)) {
      const int target = ToSquare(f, r);
      const Piece& occupant = squares_[target];
      if (occupant.Empty()) {
        out.push_back(Move{from, target});
      } else {
        if (occupant.color != side_) {
          Move move{from, target};
          move.capture = true;
          out.push_back(move);
        }
        break;
      }
      f += deltas[i][0];
      r += deltas[i][1];
    }
  }
}

void Board::AddCastleMoves(std::vector<Move>& out) const {
  const bool white = side_ == Color::kWhite;
  const int king_from = white ? 4 : 60;
  const Piece king = squares_[king_from];
  if (king.type != PieceType::kKing || king.color != side_) {
    return;
  }
  const Color enemy = Opposite(side_);
  if (IsSquareAttacked(king_from, enemy)) {
    return;
  }
  auto own_rook_at = [&](int square) {
    const Piece& piece = squares_[square];
    return piece.type == PieceType::kRook && piece.color == side_;
  };

  const std::uint8_t king_side = white ? kWhiteKingSide : kBlackKingSide;
  if ((castling_ & king_side) && own_rook_at(king_from + 3) && squares_[king_from + 1].Empty() &&
      squares_[king_from + 2].Empty() && !IsSquareAttacked(king_from + 1, enemy) &&
      !IsSquareAttacked(king_from + 2, enemy)) {
    Move move{king_from, king_from + 2};
    move.castle = true;
    out.push_back(move);
  }

  const std::uint8_t queen_side = white ? kWhiteQueenSide : kBlackQueenSide;
  if ((castling_ & queen_side) && own_rook_at(king_from - 4) && squares_[king_from - 1].Empty() &&
      squares_[king_from - 2].Empty() && squares_[king_from - 3].Empty() &&
      !IsSquareAttacked(king_from - 1, enemy) && !IsSquareAttacked(king_from - 2, enemy)) {
    Move move{king_from, king_from - 2};
    move.castle = true;
    out.push_back(move);
  }
}

bool Board::IsSquareAttacked(int square, Color by) const {
  const int file = FileOf(square);
  const int rank = RankOf(square);
  auto is = [&](int f, int r, PieceType type) {
    if (!OnBoard(f, r)) {
      return false;
    }
    const Piece& piece = squares_[ToSquare(f, r)];
    return piece.type == type && piece.color == by;
  };

  const int pawn_rank = by == Color::kWhite ? rank - 1 : rank + 1;
  if (is(file - 1, pawn_rank, PieceType::kPawn) || is(file + 1, pawn_rank, PieceType::kPawn)) {
    return true;
  }
  for (const auto& d : kKnightDeltas) {
    if (is(file + d[0], rank + d[1], PieceType::kKnight)) {
      return true;
    }
  }
  for (const auto& d : kKingDeltas) {
    if (is(file + d[0], rank + d[1], PieceType::kKing)) {
      return true;
    }
  }

  auto ray_hits = [&](const int (*dirs)[2], PieceType slider) {
    for (int i = 0; i < 4; ++i) {
      int f = file + dirs[i][0];
      int r = rank + dirs[i][1];
      while (OnBoard(f, r)) {
        const Piece& piece = squares_[ToSquare(f, r)];
        if (!piece.Empty()) {
          if (piece.color == by && (piece.type == slider || piece.type == PieceType::kQueen)) {
            return true;
          }
          break;
        }
        f += dirs[i][0];
        r += dirs[i][1];
      }
    }
    return false;
  };
  return ray_hits(kBishopDirs, PieceType::kBishop) || ray_hits(kRookDirs, PieceType::kRook);
}

int Board::KingSquare(Color color) const {
  for (int square = 0; square < 64; ++square) {
    const Piece& piece = squares_[square];
    if (piece.type == PieceType::kKing && piece.color == color) {
      return square;
    }
  }
  return -1;
}

bool Board::LeavesKingSafe(const Move& move) const {
  Board next = *this;
  next.Apply(move);
  const int king = next.KingSquare(side_);
  return king >= 0 && !next.IsSquareAttacked(king, Opposite(side_));
}

bool Board::HasLegalEnPassant() const {
  if (en_passant_ < 0) {
    return false;
  }
  for (const auto& move : PseudoLegalMoves()) {
    if (move.en_passant && LeavesKingSafe(move)) {
      return true;
    }
  }
  return false;
}

std::vector<Move> Board::LegalMoves() const {
  std::vector<Move> legal;
  for (const auto& move : PseudoLegalMoves()) {
    if (LeavesKingSafe(move)) {
      legal.push_back(move);
    }
  }
  return legal;
}

std::vector<Move> Board::LegalMovesFrom(int square) const {
  std::vector<Move> legal;
  for (const auto& move : LegalMoves()) {
    if (move.from == square) {
      legal.push_back(move);
    }
  }
  return legal;
}

void Board::Apply(const Move& move) {
  const Piece mover = squares_[move.from];
  const bool captured = !squares_[move.to].Empty() || move.en_passant;

  if (mover.type == PieceType::kPawn || captured) {
    halfmove_clock_ = 0;
  } else {
    ++halfmove_clock_;
  }

  if (move.en_passant) {
    const int victim = move.to + (mover.color == Color::kWhite ? -8 : 8);
    squares_[victim] = Piece{};
  }

  squares_[move.to] = mover;
  squares_[move.from] = Piece{};
  if (move.promotion != PieceType::kNone) {
    squares_[move.to].type = move.promotion;
  }

  if (move.castle) {
    int rook_from = -1;
    int rook_to = -1;
    if (move.to == move.from + 2) {
      rook_from = move.from + 3;
      rook_to = move.from + 1;
    } else {
      rook_from = move.from - 4;
      rook_to = move.from - 1;
    }
    squares_[rook_to] = squares_[rook_from];
    squares_[rook_from] = Piece{};
  }

  if (mover.type == PieceType::kKing) {
    castling_ &= mover.color == Color::kWhite ? ~(kWhiteKingSide | kWhiteQueenSide)
                                              : ~(kBlackKingSide | kBlackQueenSide);
  }
  for (int square : {move.from, move.to}) {
    switch (square) {
      case 0:
        castling_ &= ~kWhiteQueenSide;
        break;
      case 7:
        castling_ &= ~kWhiteKingSide;
        break;
      case 56:
        castling_ &= ~kBlackQueenSide;
        break;
      case 63:
        castling_ &= ~kBlackKingSide;
        break;
      default:
        break;
    }
  }

  en_passant_ = move.double_push ? (move.from + move.to) / 2 : -1;
  if (side_ == Color::kBlack) {
    ++fullmove_number_;
  }
  side_ = Opposite(side_);
}

bool Board::InCheck() const {
  const int king = KingSquare(side_);
  return king >= 0 && IsSquareAttacked(king, Opposite(side_));
}

bool Board::IsCheckmate() const { return InCheck() && LegalMoves().empty(); }

bool Board::IsStalemate() const { return !InCheck() && LegalMoves().empty(); }

bool Board::IsInsufficientMaterial() const {
  int pieces = 0;
  int bishops = 0;
  int knights = 0;
  int light_bishops = 0;
  for (int square = 0; square < 64; ++square) {
    const Piece& piece = squares_[square];
    if (piece.Empty()) {
      continue;
    }
    ++pieces;
    if (piece.type == PieceType::kBishop) {
      ++bishops;
      if ((FileOf(square) + RankOf(square)) % 2 == 1) {
        ++light_bishops;
      }
    } else if (piece.type == PieceType::kKnight) {
      ++knights;
    }
  }
  if (pieces == 2) {
    return true;
  }
  if (pieces == 3 && (bishops == 1 || knights == 1)) {
    return true;
  }
  if (pieces == bishops + 2) {
    return light_bishops == 0 || light_bishops == bishops;
  }
  return false;
}

bool Board::IsGameOver() const {
  return LegalMoves().empty() || IsInsufficientMaterial() || IsFiftyMoveDraw();
}

std::optional<Move> Board::ParseMove(std::string_view text) const {
  std::string token = NormalizeSan(text);
  if (token.size() == 5 && token[2] == '-' && IsUciLike(token.substr(0, 2) + token.substr(3))) {
    token.erase(2, 1);
  }
  if (token.empty() || token == "1-0" || token == "0-1" || token == "1/2-1/2" || token == "*") {
    return std::nullopt;
  }

  const auto legals = LegalMoves();

  if (IsUciLike(token)) {
    const int from = *ParseSquare(token.substr(0, 2));
    const int to = *ParseSquare(token.substr(2, 2));
    const PieceType promo = token.size() == 5 ? *PieceFromLetter(token[4]) : PieceType::kNone;
    for (const auto& move : legals) {
      if (move.from == from && move.to == to && move.promotion == promo) {
        return move;
      }
    }
    return std::nullopt;
  }

  for (const auto& move : legals) {
    if (NormalizeSan(SanAmong(move, legals)) == token) {
      return move;
    }
  }

  // 과도하게 명시된 장형 표기(Ng1f3, Ng1xf3, e7e8Q)를 허용한다.
  std::string rest = token;
  PieceType piece_type = PieceType::kPawn;
  if (!rest.empty() && std::isupper(static_cast<unsigned char>(rest[0]))) {
    auto parsed = PieceFromLetter(rest[0]);
    if (!parsed || *parsed == PieceType::kPawn) {
      return std::nullopt;
    }
    piece_type = *parsed;
    rest.erase(0, 1);
  }
  if (rest.size() >= 3 && rest[2] == 'x') {
    rest.erase(2, 1);
  }
  if (rest.size() == 5 && std::isupper(static_cast<unsigned char>(rest[4]))) {
    rest[4] = static_cast<char>(std::tolower(static_cast<unsigned char>(rest[4])));
  }
  if (!IsUciLike(rest)) {
    return std::nullopt;
  }
  const int from = *ParseSquare(rest.substr(0, 2));
  const int to = *ParseSquare(rest.substr(2, 2));
  const PieceType promo = rest.size() == 5 ? *PieceFromLetter(rest[4]) : PieceType::kNone;
  for (const auto& move : legals) {
    if (move.from == from && move.to == to && move.promotion == promo &&
        squares_[move.from].type == piece_type) {
      return move;
    }
  }
  return std::nullopt;
}

std::string Board::ToSan(const Move& move) const { return SanAmong(move, LegalMoves()); }

std::string Board::SanAmong(const Move& move, const std::vector<Move>& legals) const {
  std::string san;
  const Piece mover = squares_[move.from];

  if (move.castle) {
    san = move.to > move.from ? "O-O" : "O-O-O";
  } else {
    const bool pawn = mover.type == PieceType::kPawn;
    if (!pawn) {
      san.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(PieceLetter(mover.type)))));

      bool ambiguous = false;
      bool same_file = false;
      bool same_rank = false;
      for (const auto& other : legals) {
        if (other.to != move.to || other.from == move.from) {
          continue;
        }
        if (squares_[other.from].type != mover.type) {
          continue;
        }
        ambiguous = true;
        if (FileOf(other.from) == FileOf(move.from)) {
          same_file = true;
        }
        if (RankOf(other.from) == RankOf(move.from)) {
          same_rank = true;
        }
      }
      if (ambiguous) {
        if (!same_file) {
          san.push_back(static_cast<char>('a' + FileOf(move.from)));
        } else if (!same_rank) {
          san.push_back(static_cast<char>('1' + RankOf(move.from)));
        } else {
          san += SquareName(move.from);
        }
      }
    }
    if (move.capture) {
      if (pawn) {
        san.push_back(static_cast<char>('a' + FileOf(move.from)));
      }
      san.push_back('x');
    }
    san += SquareName(move.to);
    if (move.promotion != PieceType::kNone) {
      san.push_back('=');
      san.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(PieceLetter(move.promotion)))));
    }
  }

  Board after = *this;
  after.Apply(move);
  if (after.InCheck()) {
    san.push_back(after.LegalMoves().empty() ? '#' : '+');
  }
  return san;
}

std::string Board::ToUci(const Move& move) {
  std::string uci = SquareName(move.from) + SquareName(move.to);
  if (move.promotion != PieceType::kNone) {
    uci.push_back(PieceLetter(move.promotion));
  }
  return uci;
}

std::string Board::Ascii() const {
  std::ostringstream oss;
  oss << "   +------------------------+\n";
  for (int rank = 7; rank >= 0; --rank) {
    oss << ' ' << (rank + 1) << " |";
    for (int file = 0; file < 8; ++file) {
      oss << ' ' << PieceChar(squares_[ToSquare(file, rank)]) << ' ';
    }
    oss << "|\n";
  }
  oss << "   +------------------------+\n";
  oss << "     a  b  c  d  e  f  g  h";
  return oss.str();
}

}  // namespace arbiter::chess
