#pragma once

#include "../model/move.hpp"
#include "../model/position.hpp"
#include "config.hpp"

namespace tsume::engine {

inline int chebyshev(core::Square a, core::Square b) {
  const int df = core::file_of(a) - core::file_of(b);
  const int dr = core::rank_of(a) - core::rank_of(b);
  const int af = df < 0 ? -df : df, ar = dr < 0 ? -dr : dr;
  return af > ar ? af : ar;
}

// Angreifer: Schläge und Beförderungen zuerst, dann Nähe zum gegnerischen König
inline int check_order_score(const model::Position& pos, const model::Move& m) {
  int score = 0;
  if (m.isCapture()) score += 100 + 10 * base_value[static_cast<int>(m.captured.type)];
  if (m.promote) score += 50;
  const core::Square ksq = pos.getBoard().kingSquare(~m.piece.color);
  if (ksq != core::NO_SQUARE) score += 8 * (8 - chebyshev(m.to, ksq));
  // billige Drops vor teuren
  if (m.isDrop()) score -= base_value[static_cast<int>(m.piece.type)];
  return score;
}

// Verteidiger: Königszüge, dann Schlagen des Schachgebers, Zwischenzüge zuletzt
inline int evasion_order_score(const model::Position&, const model::Move& m) {
  if (m.piece.type == core::PieceType::King) return 1000 + (m.isCapture() ? 100 : 0);
  if (m.isCapture()) return 500 + base_value[static_cast<int>(m.captured.type)];
  if (m.isDrop()) return -base_value[static_cast<int>(m.piece.type)];
  return 100;
}

}  // namespace tsume::engine
