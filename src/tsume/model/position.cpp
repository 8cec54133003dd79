#include "tsume/model/position.hpp"

#include <array>
#include <stdexcept>

#include "tsume/engine/config.hpp"
#include "tsume/model/core/piece_moves.hpp"
#include "tsume/model/move_generator.hpp"
#include "tsume/model/move_helper.hpp"

namespace tsume::model {

namespace {

// Kann p von 'from' nach 'to' ziehen (Geometrie + freie Strecke)?
bool can_reach(const Board& b, const Piece& p, core::Square from, core::Square to) {
  const int df = core::file_of(to) - core::file_of(from);
  const int dr = core::rank_of(to) - core::rank_of(from);
  const auto& mk = moves::masks_of(p);

  if (mk.jump) return (df == 1 || df == -1) && dr == 2 * moves::forward_dr(p.color);

  if (df != 0 && dr != 0 && df != dr && df != -dr) return false;
  const int sf = (df > 0) - (df < 0), sr = (dr > 0) - (dr < 0);
  const int d = moves::dir_index(sf, sr);
  const int dist = (df != 0) ? (df < 0 ? -df : df) : (dr < 0 ? -dr : dr);
  const std::uint8_t bit = static_cast<std::uint8_t>(1u << d);

  if (dist == 1) return (mk.step & bit) || (mk.slide & bit);
  if (!(mk.slide & bit)) return false;
  for (int i = 1; i < dist; ++i) {
    const int f = core::file_of(from) + i * sf, r = core::rank_of(from) + i * sr;
    if (!b.isEmpty(core::make_square(f, r))) return false;
  }
  return true;
}

// letzte Reihe(n), auf denen die Figur keinen Zug mehr hätte
inline bool is_dead_square(core::PieceType t, core::Color c, core::Square to) {
  const int rr = core::relative_rank(c, to);
  if (t == core::PieceType::Pawn || t == core::PieceType::Lance) return rr == 1;
  if (t == core::PieceType::Knight) return rr <= 2;
  return false;
}

}  // namespace

// ---------------------- Setup ----------------------

void Position::setup(const Board& board, const Hands& hands, core::Color sideToMove) {
  Zobrist::init();
  // Brett + beide Hände dürfen den Satz nicht überschreiten, sonst läuft die
  // Handzahl beim Schlagen über HAND_MAX hinaus
  int total[core::HAND_TYPE_NB] = {};
  for (int s = 0; s < core::SQ_NB; ++s) {
    const auto p = board.getPiece(static_cast<core::Square>(s));
    if (p && is_hand_type(p->type)) ++total[static_cast<int>(p->type)];
  }
  for (auto c : {core::Color::Black, core::Color::White})
    for (int t = 0; t < core::HAND_TYPE_NB; ++t)
      total[t] += hands.count(c, static_cast<core::PieceType>(t));
  for (int t = 0; t < core::HAND_TYPE_NB; ++t)
    if (total[t] > HAND_MAX[t])
      throw std::invalid_argument("Position::setup: more pieces than in a set");

  m_board = board;
  m_hands = hands;
  m_state = GameState{};
  m_state.sideToMove = sideToMove;
  m_history.clear();
  buildHash();
}

// ---------------------- Utility Checks ----------------------

bool Position::isInCheck(core::Color c) const {
  const core::Square ksq = m_board.kingSquare(c);
  if (ksq == core::NO_SQUARE) return false;
  return attackedBy(m_board, ksq, ~c);
}

bool Position::inCheck() const {
  return isInCheck(m_state.sideToMove);
}

bool Position::isPseudoValid(const Move& m) const {
  const core::Color us = m_state.sideToMove;
  if (m.to >= core::SQ_NB) return false;

  if (m.isDrop()) {
    const auto t = m.piece.type;
    if (!is_hand_type(t) || m.promote || m.piece.promoted) return false;
    if (m.piece.color != us || m_hands.count(us, t) == 0) return false;
    if (!m_board.isEmpty(m.to)) return false;
    if (is_dead_square(t, us, m.to)) return false;
    if (t == core::PieceType::Pawn && m_board.hasPawnOnFile(us, core::file_of(m.to)))
      return false;  // Nifu
    return true;
  }

  if (m.from >= core::SQ_NB || m.from == m.to) return false;
  const auto fromPiece = m_board.getPiece(m.from);
  if (!fromPiece || fromPiece->color != us) return false;

  const auto target = m_board.getPiece(m.to);
  if (target && (target->color == us || target->type == core::PieceType::King)) return false;

  if (m.promote) {
    if (!is_promotable(fromPiece->type) || fromPiece->promoted) return false;
    if (!core::in_promotion_zone(us, m.from) && !core::in_promotion_zone(us, m.to)) return false;
  } else if (!fromPiece->promoted && is_dead_square(fromPiece->type, us, m.to)) {
    return false;  // Zwangsbeförderung
  }

  return can_reach(m_board, *fromPiece, m.from, m.to);
}

// ---------------------- Make/Unmake ----------------------

bool Position::doMove(const Move& m) {
  if (!isPseudoValid(m)) return false;

  StateInfo st{};
  if (m.isDrop()) {
    st.move = Move::drop(m.to, m.piece.type, m_state.sideToMove);
  } else {
    st.move = Move::relocate(m.from, m.to, *m_board.getPiece(m.from), m.promote);
  }
  st.zobristKey = m_hash;

  applyMove(st.move, st);

  // Illegal (eigener König im Schach) => rollback
  const core::Color movedSide = ~m_state.sideToMove;
  if (isInCheck(movedSide)) {
    unapplyMove(st);
    m_hash = st.zobristKey;
    return false;
  }

  st.gaveCheck = isInCheck(m_state.sideToMove) ? 1 : 0;
  m_history.push_back(st);

  // Uchifuzume: ein Bauern-Drop darf nicht sofort mattsetzen. Ein Drop kann nur
  // selbst Schach geben, also hilft dem Gegner nur ein Brettzug.
  if (st.gaveCheck && st.move.isDrop() && st.move.piece.type == core::PieceType::Pawn &&
      !hasLegalBoardMove()) {
    undoMove();
    return false;
  }
  return true;
}

void Position::undoMove() {
  if (m_history.empty()) return;
  const StateInfo st = m_history.back();
  unapplyMove(st);
  m_hash = st.zobristKey;
  m_history.pop_back();
}

void Position::applyMove(const Move& m, StateInfo& st) {
  const core::Color us = m_state.sideToMove;

  if (m.isDrop()) {
    const int before = m_hands.count(us, m.piece.type);
    m_hands.remove(us, m.piece.type);
    hashHandChange(us, m.piece.type, before, before - 1);
    m_board.setPiece(m.to, m.piece);
    hashXorPiece(m.piece, m.to);
  } else {
    if (const auto cap = m_board.getPiece(m.to)) {
      st.move.captured = *cap;
      hashXorPiece(*cap, m.to);
      m_board.removePiece(m.to);
      const int before = m_hands.count(us, cap->type);
      m_hands.add(us, cap->type);
      hashHandChange(us, cap->type, before, before + 1);
    }
    hashXorPiece(m.piece, m.from);
    m_board.movePiece(m.from, m.to, m.promote);
    Piece moved = m.piece;
    moved.promoted = moved.promoted || m.promote;
    hashXorPiece(moved, m.to);
  }

  m_state.sideToMove = ~us;
  ++m_state.moveNumber;
  hashXorSide();
}

void Position::unapplyMove(const StateInfo& st) {
  const Move& m = st.move;
  m_state.sideToMove = ~m_state.sideToMove;
  --m_state.moveNumber;
  const core::Color us = m_state.sideToMove;

  m_board.removePiece(m.to);
  if (m.isDrop()) {
    m_hands.add(us, m.piece.type);
    return;
  }
  m_board.setPiece(m.from, m.piece);
  if (m.isCapture()) {
    m_board.setPiece(m.to, m.captured);
    m_hands.remove(us, m.captured.type);
  }
}

// ---------------------- Legalität ----------------------

bool Position::isLegal(const Move& m) {
  if (!doMove(m)) return false;
  undoMove();
  return true;
}

bool Position::hasLegalBoardMove() {
  std::array<Move, engine::MAX_MOVES> moves;
  engine::MoveBuffer buf(moves.data(), engine::MAX_MOVES);
  MoveGenerator mg;
  const int n = mg.generateBoardMoves(m_board, m_state, buf);
  for (int i = 0; i < n; ++i) {
    if (doMove(moves[i])) {
      undoMove();
      return true;
    }
  }
  return false;
}

bool Position::hasLegalMove() {
  std::array<Move, engine::MAX_MOVES> moves;
  engine::MoveBuffer buf(moves.data(), engine::MAX_MOVES);
  MoveGenerator mg;
  const int n = inCheck() ? mg.generateEvasions(m_board, m_hands, m_state, buf)
                          : mg.generatePseudoLegalMoves(m_board, m_hands, m_state, buf);
  for (int i = 0; i < n; ++i) {
    if (doMove(moves[i])) {
      undoMove();
      return true;
    }
  }
  return false;
}

bool Position::isCheckmate() {
  return inCheck() && !hasLegalMove();
}

}  // namespace tsume::model
