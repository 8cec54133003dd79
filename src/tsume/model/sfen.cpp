#include "tsume/model/sfen.hpp"

#include <cctype>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "tsume/model/move_generator.hpp"

namespace tsume::model::sfen {

namespace {

using core::Color;
using core::PieceType;

// Hand-Reihenfolge beim Schreiben: R B G S N L P
constexpr PieceType HAND_ORDER[core::HAND_TYPE_NB] = {
    PieceType::Rook,   PieceType::Bishop, PieceType::Gold, PieceType::Silver,
    PieceType::Knight, PieceType::Lance,  PieceType::Pawn};

std::optional<PieceType> type_from_letter(char ch) {
  switch (std::tolower(static_cast<unsigned char>(ch))) {
    case 'p':
      return PieceType::Pawn;
    case 'l':
      return PieceType::Lance;
    case 'n':
      return PieceType::Knight;
    case 's':
      return PieceType::Silver;
    case 'g':
      return PieceType::Gold;
    case 'b':
      return PieceType::Bishop;
    case 'r':
      return PieceType::Rook;
    case 'k':
      return PieceType::King;
    default:
      return std::nullopt;
  }
}

char letter_of(PieceType t, Color c) {
  static constexpr char LETTERS[core::PIECE_TYPE_NB] = {'P', 'L', 'N', 'S', 'G', 'B', 'R', 'K'};
  const char up = LETTERS[static_cast<int>(t)];
  return c == Color::Black ? up : static_cast<char>(std::tolower(static_cast<unsigned char>(up)));
}

bool isNonNegativeInteger(const std::string& field) {
  if (field.empty()) return false;
  for (char c : field)
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  return true;
}

// Brettfeld parsen; wirft bei Fehlern
void parse_board(const std::string& field, Board& board) {
  int rank = 1;
  int file = 9;
  bool promoted = false;
  for (char ch : field) {
    if (ch == '/') {
      if (file != 0 || promoted) throw std::invalid_argument("sfen: bad rank length");
      ++rank;
      file = 9;
      if (rank > 9) throw std::invalid_argument("sfen: too many ranks");
      continue;
    }
    if (std::isdigit(static_cast<unsigned char>(ch))) {
      const int n = ch - '0';
      if (n <= 0 || n > file || promoted) throw std::invalid_argument("sfen: bad empty count");
      file -= n;
      continue;
    }
    if (ch == '+') {
      if (promoted) throw std::invalid_argument("sfen: double '+'");
      promoted = true;
      continue;
    }
    const auto t = type_from_letter(ch);
    if (!t) throw std::invalid_argument(std::string("sfen: unknown piece letter ") + ch);
    if (file < 1) throw std::invalid_argument("sfen: rank overflow");
    if (promoted && !is_promotable(*t)) throw std::invalid_argument("sfen: piece cannot promote");
    const Color c = std::isupper(static_cast<unsigned char>(ch)) ? Color::Black : Color::White;
    board.setPiece(core::make_square(file, rank), Piece{*t, c, promoted});
    promoted = false;
    --file;
  }
  if (rank != 9 || file != 0 || promoted) throw std::invalid_argument("sfen: incomplete board");
}

void parse_hands(const std::string& field, Hands& hands) {
  if (field == "-") return;
  int count = 0;
  for (char ch : field) {
    if (std::isdigit(static_cast<unsigned char>(ch))) {
      count = count * 10 + (ch - '0');
      if (count > 18) throw std::invalid_argument("sfen: hand count too large");
      continue;
    }
    const auto t = type_from_letter(ch);
    if (!t || !is_hand_type(*t)) throw std::invalid_argument("sfen: bad hand piece");
    const Color c = std::isupper(static_cast<unsigned char>(ch)) ? Color::Black : Color::White;
    hands.add(c, *t, count == 0 ? 1 : count);
    count = 0;
  }
  if (count != 0) throw std::invalid_argument("sfen: dangling hand count");
}

}  // namespace

bool is_basic_sfen_valid(const std::string& sfen) {
  std::istringstream ss(sfen);
  std::vector<std::string> fields;
  std::string tok;
  while (ss >> tok) fields.push_back(tok);
  if (fields.size() < 3 || fields.size() > 4) return false;
  if (fields[1] != "b" && fields[1] != "w") return false;
  if (fields.size() == 4 && !isNonNegativeInteger(fields[3])) return false;
  try {
    Board board;
    Hands hands;
    parse_board(fields[0], board);
    parse_hands(fields[2], hands);
  } catch (const std::invalid_argument&) {
    return false;
  }
  return true;
}

Position parse(const std::string& sfen) {
  std::istringstream iss(sfen);
  std::string boardField, side, handField, moveNumber;
  iss >> boardField >> side >> handField >> moveNumber;
  if (boardField.empty() || handField.empty()) throw std::invalid_argument("sfen: missing fields");
  if (side != "b" && side != "w") throw std::invalid_argument("sfen: bad side to move");
  if (!moveNumber.empty() && !isNonNegativeInteger(moveNumber))
    throw std::invalid_argument("sfen: bad move number");

  Board board;
  Hands hands;
  parse_board(boardField, board);
  parse_hands(handField, hands);

  Position pos;
  pos.setup(board, hands, side == "b" ? Color::Black : Color::White);
  if (!moveNumber.empty()) {
    pos.getState().moveNumber = static_cast<std::uint32_t>(std::stoul(moveNumber));
  }
  return pos;
}

std::string to_sfen(const Position& pos) {
  std::string out;
  const Board& b = pos.getBoard();
  for (int rank = 1; rank <= 9; ++rank) {
    int empty = 0;
    for (int file = 9; file >= 1; --file) {
      const auto p = b.getPiece(core::make_square(file, rank));
      if (!p) {
        ++empty;
        continue;
      }
      if (empty) {
        out += static_cast<char>('0' + empty);
        empty = 0;
      }
      if (p->promoted) out += '+';
      out += letter_of(p->type, p->color);
    }
    if (empty) out += static_cast<char>('0' + empty);
    if (rank != 9) out += '/';
  }

  out += pos.getState().sideToMove == Color::Black ? " b " : " w ";

  std::string hands;
  for (auto c : {Color::Black, Color::White}) {
    for (auto t : HAND_ORDER) {
      const int n = pos.getHands().count(c, t);
      if (n == 0) continue;
      if (n > 1) hands += std::to_string(n);
      hands += letter_of(t, c);
    }
  }
  out += hands.empty() ? "-" : hands;
  out += ' ';
  out += std::to_string(pos.getState().moveNumber);
  return out;
}

std::string square_to_usi(core::Square sq) {
  std::string s;
  s += static_cast<char>('0' + core::file_of(sq));
  s += static_cast<char>('a' + core::rank_of(sq) - 1);
  return s;
}

std::optional<core::Square> usi_to_square(const std::string& s) {
  if (s.size() != 2) return std::nullopt;
  const int file = s[0] - '0';
  const int rank = s[1] - 'a' + 1;
  if (!core::on_board(file, rank)) return std::nullopt;
  return core::make_square(file, rank);
}

std::string move_to_usi(const Move& m) {
  if (m.isNull()) return "0000";
  if (m.isDrop()) {
    std::string s(1, letter_of(m.piece.type, Color::Black));
    return s + '*' + square_to_usi(m.to);
  }
  std::string s = square_to_usi(m.from) + square_to_usi(m.to);
  if (m.promote) s += '+';
  return s;
}

std::optional<Move> parse_usi_move(Position& pos, const std::string& usi) {
  MoveGenerator mg;
  std::vector<Move> legal;
  mg.generateLegalMoves(pos, legal);
  for (const auto& m : legal)
    if (move_to_usi(m) == usi) return m;
  return std::nullopt;
}

}  // namespace tsume::model::sfen
