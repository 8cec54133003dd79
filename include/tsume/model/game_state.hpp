#pragma once
#include <cstdint>
#include <type_traits>

#include "core/model_types.hpp"
#include "move.hpp"

namespace tsume::model {

struct GameState {
  std::uint32_t moveNumber = 1;
  core::Color sideToMove = core::Color::Black;
};

struct StateInfo {
  Move move{};                 // last move, captured filled from the board
  std::uint64_t zobristKey{};  // full hash before move
  std::uint8_t gaveCheck{0};   // 0/1
};

static_assert(std::is_trivially_copyable_v<StateInfo>, "StateInfo should be POD");

}  // namespace tsume::model
