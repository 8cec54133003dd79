#pragma once
#include <cstdint>

#include "board.hpp"
#include "game_state.hpp"
#include "hands.hpp"

namespace tsume::model {

struct Zobrist {
  // Zobrist-Tables
  static std::uint64_t piece[2][16][core::SQ_NB];  // [color][kind_of][square]
  static std::uint64_t hand[2][core::HAND_TYPE_NB][19];  // [color][type][count]
  static std::uint64_t side;

  // Init: fester Seed, deterministisch; mehrfacher Aufruf ist harmlos
  static void init(std::uint64_t seed);
  static void init();

  // Vollständiger Hash (teuer, nur für Setup/Checks)
  template <class PositionLike>
  static std::uint64_t compute(const PositionLike& pos) noexcept {
    std::uint64_t h = 0;
    const Board& b = pos.getBoard();
    for (int s = 0; s < core::SQ_NB; ++s) {
      const auto p = b.getPiece(static_cast<core::Square>(s));
      if (p) h ^= piece[ci(p->color)][kind_of(*p)][s];
    }
    const Hands& hs = pos.getHands();
    for (int c = 0; c < 2; ++c)
      for (int t = 0; t < core::HAND_TYPE_NB; ++t)
        h ^= hand[c][t][hs.count(static_cast<core::Color>(c), static_cast<core::PieceType>(t))];
    if (pos.getState().sideToMove == core::Color::White) h ^= side;
    return h;
  }
};

}  // namespace tsume::model
