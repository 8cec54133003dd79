#pragma once
#include <array>
#include <cstdint>

#include "core/model_types.hpp"

namespace tsume::model {

// Captured pieces per side, always in unpromoted form
class Hands {
 public:
  int count(core::Color c, core::PieceType t) const noexcept {
    return m_counts[ci(c)][static_cast<int>(t)];
  }
  void set(core::Color c, core::PieceType t, int n) noexcept {
    m_counts[ci(c)][static_cast<int>(t)] = static_cast<std::uint8_t>(n);
  }
  void add(core::Color c, core::PieceType t, int n = 1) noexcept {
    m_counts[ci(c)][static_cast<int>(t)] += static_cast<std::uint8_t>(n);
  }
  // false wenn die Hand diesen Typ nicht enthält
  bool remove(core::Color c, core::PieceType t) noexcept {
    auto& n = m_counts[ci(c)][static_cast<int>(t)];
    if (n == 0) return false;
    --n;
    return true;
  }
  bool empty(core::Color c) const noexcept {
    for (auto n : m_counts[ci(c)])
      if (n) return false;
    return true;
  }
  void clear() noexcept {
    for (auto& side : m_counts) side.fill(0);
  }

  bool operator==(const Hands&) const = default;

 private:
  std::array<std::array<std::uint8_t, core::HAND_TYPE_NB>, 2> m_counts{};
};

}  // namespace tsume::model
