#pragma once
#include <cstdint>
#include <type_traits>

#include "core/model_types.hpp"

namespace tsume::model {

enum class MoveKind : std::uint8_t { Relocate = 0, Drop };

// Relocate: Figur auf dem Brett zieht (evtl. schlagend, evtl. mit Beförderung)
// Drop: Figur aus der Hand wird auf ein leeres Feld gesetzt
struct Move {
  MoveKind kind = MoveKind::Relocate;
  core::Square from = core::NO_SQUARE;  // NO_SQUARE bei Drops
  core::Square to = core::NO_SQUARE;
  Piece piece{};     // ziehende Figur vor dem Zug
  Piece captured{};  // type None wenn nichts geschlagen wird
  bool promote = false;

  constexpr Move() noexcept = default;

  [[nodiscard]] static constexpr Move relocate(core::Square from, core::Square to, Piece piece,
                                               bool promote, Piece captured = {}) noexcept {
    Move m;
    m.kind = MoveKind::Relocate;
    m.from = from;
    m.to = to;
    m.piece = piece;
    m.promote = promote;
    m.captured = captured;
    return m;
  }

  [[nodiscard]] static constexpr Move drop(core::Square to, core::PieceType t,
                                           core::Color c) noexcept {
    Move m;
    m.kind = MoveKind::Drop;
    m.to = to;
    m.piece = Piece{t, c, false};
    return m;
  }

  [[nodiscard]] constexpr bool isDrop() const noexcept { return kind == MoveKind::Drop; }
  [[nodiscard]] constexpr bool isCapture() const noexcept {
    return captured.type != core::PieceType::None;
  }
  [[nodiscard]] constexpr bool isNull() const noexcept { return to == core::NO_SQUARE; }
};

constexpr inline bool operator==(const Move& a, const Move& b) noexcept {
  return a.kind == b.kind && a.from == b.from && a.to == b.to && a.piece == b.piece &&
         a.promote == b.promote && a.captured == b.captured;
}

static_assert(std::is_trivially_copyable_v<Move>, "Move must be trivially copyable");

}  // namespace tsume::model
