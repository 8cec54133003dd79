#pragma once
#include <array>
#include <cstdint>

#include "model_types.hpp"

// =======================================================
// Movement tables for every piece kind.
// Directions are unit vectors (df, dr) seen from Black:
// dr = -1 is forward. White pieces use the mirrored
// direction (index + 4) & 7.
// The knight jump is handled separately.
// =======================================================

namespace tsume::model::moves {

struct Dir {
  std::int8_t df;
  std::int8_t dr;
};

//   7 0 1
//   6 . 2
//   5 4 3
constexpr Dir DIRS[8] = {{0, -1}, {1, -1}, {1, 0}, {1, 1}, {0, 1}, {-1, 1}, {-1, 0}, {-1, -1}};

[[nodiscard]] constexpr inline int dir_index(int df, int dr) noexcept {
  for (int i = 0; i < 8; ++i)
    if (DIRS[i].df == df && DIRS[i].dr == dr) return i;
  return -1;
}

[[nodiscard]] constexpr inline std::uint8_t mirror_mask(std::uint8_t m) noexcept {
  return static_cast<std::uint8_t>((m << 4) | (m >> 4));
}

namespace detail {
constexpr std::uint8_t bit(int i) {
  return static_cast<std::uint8_t>(1u << i);
}
constexpr std::uint8_t FWD = bit(0);
constexpr std::uint8_t DIAG = bit(1) | bit(3) | bit(5) | bit(7);
constexpr std::uint8_t ORTHO = bit(0) | bit(2) | bit(4) | bit(6);
constexpr std::uint8_t GOLD = bit(0) | bit(1) | bit(7) | bit(2) | bit(6) | bit(4);
constexpr std::uint8_t SILVER = bit(0) | bit(1) | bit(7) | bit(3) | bit(5);
constexpr std::uint8_t KING = 0xFF;

struct KindMasks {
  std::uint8_t step;
  std::uint8_t slide;
  bool jump;
};

// indexed by kind_of(): Pawn, Lance, Knight, Silver, Gold, Bishop, Rook, King,
// then the promoted forms in the same order
constexpr KindMasks KIND_MASKS[16] = {
    {FWD, 0, false},      {0, FWD, false},     {0, 0, true},      {SILVER, 0, false},
    {GOLD, 0, false},     {0, DIAG, false},    {0, ORTHO, false}, {KING, 0, false},
    {GOLD, 0, false},     {GOLD, 0, false},    {GOLD, 0, false},  {GOLD, 0, false},
    {GOLD, 0, false},     {ORTHO, DIAG, false}, {DIAG, ORTHO, false}, {KING, 0, false}};
}  // namespace detail

struct MoveMasks {
  std::uint8_t step;
  std::uint8_t slide;
  bool jump;
};

// Schnelle Lookup-Tabelle [color][kind]
constexpr std::array<std::array<MoveMasks, 16>, 2> MASKS = [] {
  std::array<std::array<MoveMasks, 16>, 2> t{};
  for (int k = 0; k < 16; ++k) {
    const auto& km = detail::KIND_MASKS[k];
    t[0][k] = MoveMasks{km.step, km.slide, km.jump};
    t[1][k] = MoveMasks{mirror_mask(km.step), mirror_mask(km.slide), km.jump};
  }
  return t;
}();

[[nodiscard]] constexpr inline const MoveMasks& masks_of(const Piece& p) noexcept {
  return MASKS[ci(p.color)][kind_of(p)];
}

// Knight jumps are (+-1, 2 * forward)
[[nodiscard]] constexpr inline int forward_dr(core::Color c) noexcept {
  return c == core::Color::Black ? -1 : 1;
}

}  // namespace tsume::model::moves
