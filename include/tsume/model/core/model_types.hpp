#pragma once
#include <cstdint>

#include "../../shogi_types.hpp"

// =======================================================
// Square layout in Japanese notation:
// - index = (rank - 1) * 9 + (file - 1)
// - index 0  = 1a (file 1, rank 1, top right from Black's view)
// - index 80 = 9i (bottom left from Black's view)
// Black moves towards rank 1, White towards rank 9.
// This File defines:
// - square helpers (file/rank, promotion zone)
// - Piece and its packed form used by the Board
// =======================================================

namespace tsume {
namespace core {

[[nodiscard]] constexpr inline Square make_square(int file, int rank) noexcept {
  return static_cast<Square>((rank - 1) * 9 + (file - 1));
}

[[nodiscard]] constexpr inline int file_of(Square sq) noexcept {
  return static_cast<int>(sq) % 9 + 1;
}

[[nodiscard]] constexpr inline int rank_of(Square sq) noexcept {
  return static_cast<int>(sq) / 9 + 1;
}

[[nodiscard]] constexpr inline bool on_board(int file, int rank) noexcept {
  return file >= 1 && file <= 9 && rank >= 1 && rank <= 9;
}

// 1 = the rank farthest away from c's own camp
[[nodiscard]] constexpr inline int relative_rank(Color c, Square sq) noexcept {
  return c == Color::Black ? rank_of(sq) : 10 - rank_of(sq);
}

[[nodiscard]] constexpr inline bool in_promotion_zone(Color c, Square sq) noexcept {
  return relative_rank(c, sq) <= 3;
}

}  // namespace core

namespace model {

struct Piece {
  core::PieceType type = core::PieceType::None;
  core::Color color = core::Color::Black;
  bool promoted = false;

  bool operator==(const Piece&) const = default;
};

[[nodiscard]] constexpr inline int ci(core::Color c) noexcept {
  return static_cast<int>(c);
}

[[nodiscard]] constexpr inline bool is_promotable(core::PieceType t) noexcept {
  return t != core::PieceType::Gold && t != core::PieceType::King && t != core::PieceType::None;
}

[[nodiscard]] constexpr inline bool is_hand_type(core::PieceType t) noexcept {
  return static_cast<int>(t) < core::HAND_TYPE_NB;
}

// Movement kind: type index, +8 when promoted (0..15)
[[nodiscard]] constexpr inline int kind_of(const Piece& p) noexcept {
  return static_cast<int>(p.type) + (p.promoted ? 8 : 0);
}

// Number of copies of each hand type in a full set (both sides together)
constexpr int HAND_MAX[core::HAND_TYPE_NB] = {18, 4, 4, 4, 4, 2, 2};

}  // namespace model
}  // namespace tsume
