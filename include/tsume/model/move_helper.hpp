#pragma once
#include <initializer_list>

#include "board.hpp"
#include "core/piece_moves.hpp"

namespace tsume::model {

// ---------------- Angriffsabfrage ----------------

namespace detail {
// p steht 'dist' Felder von sq entfernt in Richtung 'dirFromSq'
inline bool reaches(const Piece& p, int dirFromSq, int dist) noexcept {
  const auto& mk = moves::masks_of(p);
  const std::uint8_t towards = static_cast<std::uint8_t>(1u << ((dirFromSq + 4) & 7));
  if (mk.slide & towards) return true;
  return dist == 1 && (mk.step & towards);
}

inline bool is_knight_of(const Board& b, int file, int rank, core::Color by) noexcept {
  if (!core::on_board(file, rank)) return false;
  const auto p = b.getPiece(core::make_square(file, rank));
  return p && p->color == by && p->type == core::PieceType::Knight && !p->promoted;
}
}  // namespace detail

inline bool attackedBy(const Board& b, core::Square sq, core::Color by) noexcept {
  const int f = core::file_of(sq);
  const int r = core::rank_of(sq);

  const int kr = r - 2 * moves::forward_dr(by);
  if (detail::is_knight_of(b, f - 1, kr, by) || detail::is_knight_of(b, f + 1, kr, by))
    return true;

  for (int d = 0; d < 8; ++d) {
    const int df = moves::DIRS[d].df, dr = moves::DIRS[d].dr;
    int cf = f + df, cr = r + dr;
    for (int dist = 1; core::on_board(cf, cr); ++dist, cf += df, cr += dr) {
      const auto p = b.getPiece(core::make_square(cf, cr));
      if (!p) continue;
      if (p->color == by && detail::reaches(*p, d, dist)) return true;
      break;
    }
  }
  return false;
}

// Alle Angreifer von 'by' auf sq (höchstens 2 werden gemeldet, mehr braucht die Evasion nicht)
inline int checkersOf(const Board& b, core::Square sq, core::Color by, core::Square out[2]) noexcept {
  int n = 0;
  const int f = core::file_of(sq);
  const int r = core::rank_of(sq);

  const int kr = r - 2 * moves::forward_dr(by);
  for (int df : {-1, 1}) {
    if (detail::is_knight_of(b, f + df, kr, by)) {
      out[n++] = core::make_square(f + df, kr);
      if (n == 2) return n;
    }
  }

  for (int d = 0; d < 8; ++d) {
    const int df = moves::DIRS[d].df, dr = moves::DIRS[d].dr;
    int cf = f + df, cr = r + dr;
    for (int dist = 1; core::on_board(cf, cr); ++dist, cf += df, cr += dr) {
      const auto p = b.getPiece(core::make_square(cf, cr));
      if (!p) continue;
      if (p->color == by && detail::reaches(*p, d, dist)) {
        out[n++] = core::make_square(cf, cr);
        if (n == 2) return n;
      }
      break;
    }
  }
  return n;
}

// Felder strikt zwischen a und b auf einer Linie; leer wenn nicht ausgerichtet oder benachbart
inline int squaresBetween(core::Square a, core::Square b, core::Square out[8]) noexcept {
  const int af = core::file_of(a), ar = core::rank_of(a);
  const int df = core::file_of(b) - af, dr = core::rank_of(b) - ar;
  if (df != 0 && dr != 0 && df != dr && df != -dr) return 0;
  const int sf = (df > 0) - (df < 0), sr = (dr > 0) - (dr < 0);
  int n = 0;
  for (int f = af + sf, r = ar + sr; f != af + df || r != ar + dr; f += sf, r += sr)
    out[n++] = core::make_square(f, r);
  return n;
}

}  // namespace tsume::model
