#include "tsume/model/move_generator.hpp"

#include "tsume/model/core/piece_moves.hpp"
#include "tsume/model/move.hpp"
#include "tsume/model/move_helper.hpp"
#include "tsume/model/position.hpp"

namespace tsume::model {

namespace {

using core::Color;
using core::PieceType;
using core::Square;

inline bool is_dead_square(PieceType t, Color c, Square to) noexcept {
  const int rr = core::relative_rank(c, to);
  if (t == PieceType::Pawn || t == PieceType::Lance) return rr == 1;
  if (t == PieceType::Knight) return rr <= 2;
  return false;
}

// Zielfeld mit allen Promotion-Varianten ausgeben (Beförderung zuerst)
template <class Push>
inline void emit(const Board& b, Square from, Square to, const Piece& p, Push& push) {
  const auto target = b.getPiece(to);
  const Piece cap = target ? *target : Piece{};
  if (cap.type == PieceType::King) return;

  if (p.promoted || !is_promotable(p.type)) {
    push(Move::relocate(from, to, p, false, cap));
    return;
  }
  const bool canPromote =
      core::in_promotion_zone(p.color, from) || core::in_promotion_zone(p.color, to);
  if (canPromote) push(Move::relocate(from, to, p, true, cap));
  if (!is_dead_square(p.type, p.color, to)) push(Move::relocate(from, to, p, false, cap));
}

template <class Push>
void gen_piece(const Board& b, Square from, const Piece& p, Push& push) {
  const int f = core::file_of(from), r = core::rank_of(from);
  const auto& mk = moves::masks_of(p);

  auto try_target = [&](int tf, int tr) -> bool {  // true = Strahl geht weiter
    if (!core::on_board(tf, tr)) return false;
    const Square to = core::make_square(tf, tr);
    const auto occ = b.getPiece(to);
    if (occ && occ->color == p.color) return false;
    emit(b, from, to, p, push);
    return !occ;
  };

  if (mk.jump) {
    const int tr = r + 2 * moves::forward_dr(p.color);
    try_target(f - 1, tr);
    try_target(f + 1, tr);
    return;
  }

  for (int d = 0; d < 8; ++d) {
    const std::uint8_t bit = static_cast<std::uint8_t>(1u << d);
    const int df = moves::DIRS[d].df, dr = moves::DIRS[d].dr;
    if (mk.slide & bit) {
      for (int tf = f + df, tr = r + dr; try_target(tf, tr); tf += df, tr += dr) {
      }
    } else if (mk.step & bit) {
      try_target(f + df, r + dr);
    }
  }
}

template <class Push>
void gen_board(const Board& b, Color us, Push& push) {
  for (int s = 0; s < core::SQ_NB; ++s) {
    const auto p = b.getPiece(static_cast<Square>(s));
    if (p && p->color == us) gen_piece(b, static_cast<Square>(s), *p, push);
  }
}

template <class Push>
void gen_drops_to(const Board& b, const Hands& h, Color us, Square to, Push& push) {
  if (!b.isEmpty(to)) return;
  for (int t = 0; t < core::HAND_TYPE_NB; ++t) {
    const auto pt = static_cast<PieceType>(t);
    if (h.count(us, pt) == 0 || is_dead_square(pt, us, to)) continue;
    if (pt == PieceType::Pawn && b.hasPawnOnFile(us, core::file_of(to))) continue;  // Nifu
    push(Move::drop(to, pt, us));
  }
}

template <class Push>
void gen_drops(const Board& b, const Hands& h, Color us, Push& push) {
  if (h.empty(us)) return;
  for (int s = 0; s < core::SQ_NB; ++s) gen_drops_to(b, h, us, static_cast<Square>(s), push);
}

template <class Push>
void gen_evasions(const Board& b, const Hands& h, Color us, Push& push) {
  const Square ksq = b.kingSquare(us);
  Square chk[2];
  const int nChk = ksq == core::NO_SQUARE ? 0 : checkersOf(b, ksq, ~us, chk);
  if (nChk == 0) {
    gen_board(b, us, push);
    gen_drops(b, h, us, push);
    return;
  }

  // Königszüge
  gen_piece(b, ksq, *b.getPiece(ksq), push);
  if (nChk > 1) return;  // Doppelschach: nur der König

  // Checker schlagen oder Linie blocken
  Square between[8];
  const int nBetween = squaresBetween(ksq, chk[0], between);
  bool target[core::SQ_NB] = {};
  target[chk[0]] = true;
  for (int i = 0; i < nBetween; ++i) target[between[i]] = true;

  auto filtered = [&](const Move& m) {
    if (target[m.to]) push(m);
  };
  for (int s = 0; s < core::SQ_NB; ++s) {
    if (s == ksq) continue;
    const auto p = b.getPiece(static_cast<Square>(s));
    if (p && p->color == us) gen_piece(b, static_cast<Square>(s), *p, filtered);
  }
  for (int i = 0; i < nBetween; ++i) gen_drops_to(b, h, us, between[i], push);
}

}  // namespace

// ---------------- std::vector API ----------------

void MoveGenerator::generatePseudoLegalMoves(const Board& b, const Hands& h, const GameState& st,
                                             std::vector<Move>& out) const {
  out.clear();
  auto push = [&](const Move& m) { out.push_back(m); };
  gen_board(b, st.sideToMove, push);
  gen_drops(b, h, st.sideToMove, push);
}

void MoveGenerator::generateBoardMoves(const Board& b, const GameState& st,
                                       std::vector<Move>& out) const {
  out.clear();
  auto push = [&](const Move& m) { out.push_back(m); };
  gen_board(b, st.sideToMove, push);
}

void MoveGenerator::generateDrops(const Board& b, const Hands& h, const GameState& st,
                                  std::vector<Move>& out) const {
  out.clear();
  auto push = [&](const Move& m) { out.push_back(m); };
  gen_drops(b, h, st.sideToMove, push);
}

void MoveGenerator::generateEvasions(const Board& b, const Hands& h, const GameState& st,
                                     std::vector<Move>& out) const {
  out.clear();
  auto push = [&](const Move& m) { out.push_back(m); };
  gen_evasions(b, h, st.sideToMove, push);
}

void MoveGenerator::generateLegalMoves(Position& pos, std::vector<Move>& out) const {
  std::vector<Move> pseudo;
  if (pos.inCheck())
    generateEvasions(pos.getBoard(), pos.getHands(), pos.getState(), pseudo);
  else
    generatePseudoLegalMoves(pos.getBoard(), pos.getHands(), pos.getState(), pseudo);

  out.clear();
  for (const auto& m : pseudo)
    if (pos.isLegal(m)) out.push_back(m);
}

// ---------------- MoveBuffer API ----------------

int MoveGenerator::generatePseudoLegalMoves(const Board& b, const Hands& h, const GameState& st,
                                            engine::MoveBuffer& buf) const {
  auto push = [&](const Move& m) { buf.push(m); };
  gen_board(b, st.sideToMove, push);
  gen_drops(b, h, st.sideToMove, push);
  return buf.n;
}

int MoveGenerator::generateBoardMoves(const Board& b, const GameState& st,
                                      engine::MoveBuffer& buf) const {
  auto push = [&](const Move& m) { buf.push(m); };
  gen_board(b, st.sideToMove, push);
  return buf.n;
}

int MoveGenerator::generateEvasions(const Board& b, const Hands& h, const GameState& st,
                                    engine::MoveBuffer& buf) const {
  auto push = [&](const Move& m) { buf.push(m); };
  gen_evasions(b, h, st.sideToMove, push);
  return buf.n;
}

}  // namespace tsume::model
