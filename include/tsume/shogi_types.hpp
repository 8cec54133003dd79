#pragma once
#include <cstdint>
namespace tsume::core {
using Square = std::uint8_t;
constexpr Square NO_SQUARE = 81;
constexpr int SQ_NB = 81;
constexpr int FILE_NB = 9;
constexpr int RANK_NB = 9;
// Hand types first (Pawn..Rook), King is never held in hand
enum class PieceType : std::uint8_t { Pawn, Lance, Knight, Silver, Gold, Bishop, Rook, King, None };
constexpr int HAND_TYPE_NB = 7;
constexpr int PIECE_TYPE_NB = 8;
// Black = sente, moves first and towards rank 1
enum class Color : std::uint8_t { Black = 0, White = 1 };
constexpr inline core::Color operator~(core::Color c) {
  return c == core::Color::Black ? core::Color::White : core::Color::Black;
}
}  // namespace tsume::core
