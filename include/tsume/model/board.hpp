#pragma once
#include <array>
#include <cstdint>
#include <optional>

#include "core/model_types.hpp"

namespace tsume::model {

class Board {
 public:
  Board();

  void clear() noexcept;

  void setPiece(core::Square sq, Piece p) noexcept;
  void removePiece(core::Square sq) noexcept;
  std::optional<Piece> getPiece(core::Square sq) const noexcept;
  bool isEmpty(core::Square sq) const noexcept { return m_piece_on[sq] == 0; }

  // NO_SQUARE wenn kein König dieser Farbe auf dem Brett steht
  core::Square kingSquare(core::Color c) const noexcept { return m_king_sq[ci(c)]; }
  int kingCount(core::Color c) const noexcept { return m_king_count[ci(c)]; }

  // nur unbeförderte Bauern zählen (Nifu)
  bool hasPawnOnFile(core::Color c, int file) const noexcept {
    return m_pawn_files[ci(c)][file - 1] != 0;
  }

  // bewegt eine Figur von 'from' nach 'to' ('to' muss leer sein)
  void movePiece(core::Square from, core::Square to, bool promote) noexcept;

  bool operator==(const Board& o) const noexcept { return m_piece_on == o.m_piece_on; }

 private:
  // 0 = leer, sonst (typeIdx+1) | promoted<<4 | color<<5
  std::array<std::uint8_t, core::SQ_NB> m_piece_on{};
  std::array<core::Square, 2> m_king_sq{core::NO_SQUARE, core::NO_SQUARE};
  std::array<std::uint8_t, 2> m_king_count{};
  std::array<std::array<std::uint8_t, core::FILE_NB>, 2> m_pawn_files{};

  // Helper
  static inline std::uint8_t pack_piece(Piece p) noexcept;
  static inline Piece unpack_piece(std::uint8_t pp) noexcept;
  void track(std::uint8_t packed, core::Square sq, int delta) noexcept;
};

}  // namespace tsume::model
